#include "ScienceConfig.hpp"

#include <cmath>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace ExergySim {

namespace {

std::mutex& global_mutex() {
    static std::mutex m;
    return m;
}

std::unique_ptr<const ScienceConfig>& global_slot() {
    static std::unique_ptr<const ScienceConfig> slot;
    return slot;
}

void require_tolerance(double tol, const char* name) {
    if (!std::isfinite(tol) || tol <= 0.0 || tol >= 1.0) {
        throw std::invalid_argument(
            std::string("ScienceConfig: ") + name + " must lie in (0, 1)");
    }
}

} // anonymous namespace

const char* to_string(GlidePolicy p) {
    switch (p) {
        case GlidePolicy::LogMean:    return "log_mean";
        case GlidePolicy::Arithmetic: return "arithmetic";
    }
    return "unknown";
}

ScienceConfig::ScienceConfig(const ScienceSettings& settings) : s_(settings) {
    if (!std::isfinite(s_.functional_unit_heat) || s_.functional_unit_heat <= 0.0) {
        throw std::invalid_argument("ScienceConfig: functional_unit_heat must be > 0");
    }
    if (s_.dh_boundary_name.empty()) {
        throw std::invalid_argument("ScienceConfig: dh_boundary_name is empty");
    }
    if (s_.energy_unit.empty() || s_.temperature_unit.empty() || s_.time_unit.empty()) {
        throw std::invalid_argument("ScienceConfig: units must be named");
    }
    if (s_.temperature_unit != "K") {
        throw std::invalid_argument(
            "ScienceConfig: temperature_unit must be K, the core works in absolute temperature");
    }
    require_tolerance(s_.conservation_rel_tol, "conservation_rel_tol");
    require_tolerance(s_.conservation_abs_tol, "conservation_abs_tol");
    require_tolerance(s_.negative_destruction_rel_tol, "negative_destruction_rel_tol");
}

const ScienceConfig& ScienceConfig::freeze(const ScienceSettings& settings) {
    std::lock_guard<std::mutex> lock(global_mutex());
    auto& slot = global_slot();
    if (slot) {
        throw std::logic_error("ScienceConfig::freeze called twice");
    }
    slot = std::make_unique<const ScienceConfig>(settings);
    return *slot;
}

const ScienceConfig& ScienceConfig::global() {
    std::lock_guard<std::mutex> lock(global_mutex());
    const auto& slot = global_slot();
    if (!slot) {
        throw std::logic_error("ScienceConfig::global used before freeze");
    }
    return *slot;
}

bool ScienceConfig::frozen() {
    std::lock_guard<std::mutex> lock(global_mutex());
    return static_cast<bool>(global_slot());
}

} // namespace ExergySim
