#include "Scenario.hpp"
#include "ExergyCore.hpp"
#include "Guardrails.hpp"
#include "Refusal.hpp"

#include <utility>

namespace ExergySim {

namespace {

void require_temperature(const ValueSpec& T, const ScienceConfig& config, const std::string& field) {
    Guardrails::require_provenance(T);
    Guardrails::require_unit(T, config.temperature_unit(), field);
    Guardrails::require_positive(T, field);
}

} // anonymous namespace

// ---------------- Scenario ----------------

const ValueSpec* Scenario::find_auxiliary(const std::string& name) const {
    auto it = aux_.find(name);
    return it == aux_.end() ? nullptr : &it->second;
}

ScenarioBuilder Scenario::revise() const {
    ScenarioBuilder b(name_);
    b.reference_temperature(T0_);
    if (Ts_ && Tr_) {
        b.supply_return(*Ts_, *Tr_);
    } else {
        b.boundary_temperature(Tb_);
    }
    b.delivery_boundary(boundary_name_);
    for (const auto& id : boundary_elements_) b.boundary_element(id);
    for (const auto& id : required_)          b.require_for_delivery(id);
    for (const auto& kv : aux_)               b.auxiliary_input(kv.first, kv.second);
    return b;
}

// ---------------- ScenarioBuilder ----------------

ScenarioBuilder::ScenarioBuilder(std::string name) : name_(std::move(name)) {}

ScenarioBuilder& ScenarioBuilder::reference_temperature(ValueSpec T0) {
    T0_ = std::move(T0);
    return *this;
}

ScenarioBuilder& ScenarioBuilder::boundary_temperature(ValueSpec Tb) {
    Tb_ = std::move(Tb);
    return *this;
}

ScenarioBuilder& ScenarioBuilder::supply_return(ValueSpec Ts, ValueSpec Tr) {
    Ts_ = std::move(Ts);
    Tr_ = std::move(Tr);
    return *this;
}

ScenarioBuilder& ScenarioBuilder::delivery_boundary(std::string name) {
    boundary_name_ = std::move(name);
    return *this;
}

ScenarioBuilder& ScenarioBuilder::boundary_element(const std::string& component_id,
                                                   bool required_for_delivery) {
    boundary_elements_.insert(component_id);
    if (required_for_delivery) required_.insert(component_id);
    return *this;
}

ScenarioBuilder& ScenarioBuilder::require_for_delivery(const std::string& component_id) {
    required_.insert(component_id);
    return *this;
}

ScenarioBuilder& ScenarioBuilder::auxiliary_input(const std::string& name, ValueSpec v) {
    aux_.insert_or_assign(name, std::move(v));
    return *this;
}

Scenario ScenarioBuilder::build(const ScienceConfig& config) const {
    Guardrails::require_non_empty(name_, "scenario.name");

    // T0 gates everything downstream; nothing is computed before it passes.
    const ValueSpec& T0 = Guardrails::require_present(T0_, "T0");
    require_temperature(T0, config, "T0");

    if (Tb_ && (Ts_ || Tr_)) {
        Refusal r;
        r.kind    = RefusalKind::InvalidTemperatureBoundary;
        r.code    = "REFUSE_TB_OVERSPECIFIED";
        r.field   = "Tb";
        r.message = "Cannot build scenario because both an explicit Tb and a supply/return "
                    "glide were given.";
        r.why     = "The boundary temperature must have exactly one definition.";
        throw RefusalError(std::move(r));
    }

    std::optional<ValueSpec> Tb;
    if (Ts_ || Tr_) {
        const ValueSpec& Ts = Guardrails::require_present(Ts_, "Ts");
        const ValueSpec& Tr = Guardrails::require_present(Tr_, "Tr");
        require_temperature(Ts, config, "Ts");
        require_temperature(Tr, config, "Tr");
        Tb = ExergyCore::boundary_temperature_from_glide(Ts, Tr, config.glide_policy());
    } else {
        Tb = Guardrails::require_present(Tb_, "Tb");
    }
    require_temperature(*Tb, config, "Tb");
    Guardrails::require_boundary_validity(T0, *Tb);

    Guardrails::require_non_empty(boundary_name_, "delivery_boundary.name");
    if (boundary_name_ != config.dh_boundary_name()) {
        Refusal r;
        r.kind    = RefusalKind::MissingBoundaryElement;
        r.code    = "REFUSE_DELIVERY_BOUNDARY_MISMATCH";
        r.field   = "delivery_boundary.name";
        r.message = "Cannot build scenario because delivery boundary '" + boundary_name_ +
                    "' is not the comparison boundary '" + config.dh_boundary_name() + "'.";
        r.why     = "All systems are compared at one frozen delivery boundary.";
        throw RefusalError(std::move(r));
    }

    for (const auto& kv : aux_) {
        Guardrails::require_provenance(kv.second);
    }

    Scenario s(name_, T0, *Tb);
    if (Ts_ && Tr_) {
        s.Ts_ = *Ts_;
        s.Tr_ = *Tr_;
    }
    s.boundary_name_     = boundary_name_;
    s.boundary_elements_ = boundary_elements_;
    s.required_          = required_;
    s.aux_               = aux_;

    Guardrails::require_boundary_completeness(s);
    return s;
}

} // namespace ExergySim
