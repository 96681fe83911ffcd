#pragma once
#include <string>

namespace ExergySim {

// How a supply/return temperature glide collapses to one boundary temperature.
enum class GlidePolicy {
    LogMean,     // (Ts - Tr) / ln(Ts / Tr), thermodynamic mean temperature
    Arithmetic   // (Ts + Tr) / 2
};

const char* to_string(GlidePolicy p);

// Raw settings, filled in once by the host before freezing.
struct ScienceSettings {
    // Comparison basis: useful heat delivered to the DH boundary.
    double      functional_unit_heat = 1.0;
    std::string functional_unit_description =
        "1 MWh useful heat delivered to DH delivery boundary";

    // Every scenario must declare this delivery boundary.
    std::string dh_boundary_name = "district_heating_delivery_boundary";

    // Units every run is normalized to before it reaches the core.
    std::string energy_unit      = "MWh";
    std::string temperature_unit = "K";   // fixed; anything else is rejected
    std::string time_unit        = "h";

    // system_input = delivered + sum(destruction) must hold within
    // max(abs, rel * scale).
    double conservation_rel_tol = 1e-9;
    double conservation_abs_tol = 1e-12;

    // A stage destruction below -tol * stage input exergy is a second-law
    // violation; smaller negatives are rounding and are reported as they are.
    double negative_destruction_rel_tol = 1e-9;

    GlidePolicy glide_policy = GlidePolicy::LogMean;
};

// Frozen scientific configuration. Constructed from validated settings and
// never changed afterwards. Core components take `const ScienceConfig&`; only
// the host touches the process-wide instance.
class ScienceConfig {
public:
    explicit ScienceConfig(const ScienceSettings& settings = ScienceSettings{});

    double functional_unit_heat() const { return s_.functional_unit_heat; }
    const std::string& functional_unit_description() const { return s_.functional_unit_description; }
    const std::string& dh_boundary_name() const { return s_.dh_boundary_name; }
    const std::string& energy_unit() const { return s_.energy_unit; }
    const std::string& temperature_unit() const { return s_.temperature_unit; }
    const std::string& time_unit() const { return s_.time_unit; }
    double conservation_rel_tol() const { return s_.conservation_rel_tol; }
    double conservation_abs_tol() const { return s_.conservation_abs_tol; }
    double negative_destruction_rel_tol() const { return s_.negative_destruction_rel_tol; }
    GlidePolicy glide_policy() const { return s_.glide_policy; }

    // Process-wide instance. freeze() may be called exactly once; global()
    // throws std::logic_error before that.
    static const ScienceConfig& freeze(const ScienceSettings& settings);
    static const ScienceConfig& global();
    static bool frozen();

private:
    ScienceSettings s_;
};

} // namespace ExergySim
