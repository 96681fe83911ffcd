#pragma once
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>

#include "ScienceConfig.hpp"
#include "ValueSpec.hpp"

namespace ExergySim {

class ScenarioBuilder;

// Shared reference context for one comparison run. Only ScenarioBuilder can
// produce one, and only after every guardrail has passed; a Scenario is never
// changed afterwards. Revised inputs produce a new Scenario (see revise()).
class Scenario {
public:
    const std::string& name() const { return name_; }

    // Reference environment temperature (K).
    const ValueSpec& T0() const { return T0_; }

    // Representative boundary temperature (K), explicit or derived from a glide.
    const ValueSpec& Tb() const { return Tb_; }

    // Present only when Tb was derived from a supply/return glide.
    const std::optional<ValueSpec>& supply_temperature() const { return Ts_; }
    const std::optional<ValueSpec>& return_temperature() const { return Tr_; }

    const std::string& delivery_boundary_name() const { return boundary_name_; }
    const std::set<std::string>& boundary_elements() const { return boundary_elements_; }
    const std::set<std::string>& required_for_delivery() const { return required_; }

    const std::map<std::string, ValueSpec>& auxiliary_inputs() const { return aux_; }

    // nullptr when no auxiliary input of that name exists.
    const ValueSpec* find_auxiliary(const std::string& name) const;

    // Builder seeded with this scenario's inputs, for producing a revision.
    ScenarioBuilder revise() const;

private:
    friend class ScenarioBuilder;

    Scenario(std::string name, ValueSpec T0, ValueSpec Tb)
        : name_(std::move(name)), T0_(std::move(T0)), Tb_(std::move(Tb)) {}

    std::string name_;
    ValueSpec   T0_;
    ValueSpec   Tb_;
    std::optional<ValueSpec> Ts_;
    std::optional<ValueSpec> Tr_;
    std::string boundary_name_;
    std::set<std::string> boundary_elements_;
    std::set<std::string> required_;
    std::map<std::string, ValueSpec> aux_;
};

// Collects externally supplied inputs; build() validates them as a unit.
class ScenarioBuilder {
public:
    explicit ScenarioBuilder(std::string name);

    ScenarioBuilder& reference_temperature(ValueSpec T0);
    ScenarioBuilder& boundary_temperature(ValueSpec Tb);

    // Tb is then derived from the glide with the configured policy.
    ScenarioBuilder& supply_return(ValueSpec Ts, ValueSpec Tr);

    ScenarioBuilder& delivery_boundary(std::string name);
    ScenarioBuilder& boundary_element(const std::string& component_id,
                                      bool required_for_delivery = false);

    // A component that must be inside the boundary, whether or not it was
    // declared there.
    ScenarioBuilder& require_for_delivery(const std::string& component_id);

    ScenarioBuilder& auxiliary_input(const std::string& name, ValueSpec v);

    // Validation order:
    //   T0 present, provenance, K, > 0
    //   Tb explicit xor glide; present, provenance, K, > 0
    //   Tb > T0
    //   delivery boundary named and equal to the configured DH boundary
    //   auxiliary inputs carry provenance
    //   required components inside the boundary
    Scenario build(const ScienceConfig& config) const;

private:
    std::string name_;
    std::optional<ValueSpec> T0_;
    std::optional<ValueSpec> Tb_;
    std::optional<ValueSpec> Ts_;
    std::optional<ValueSpec> Tr_;
    std::string boundary_name_;
    std::set<std::string> boundary_elements_;
    std::set<std::string> required_;
    std::map<std::string, ValueSpec> aux_;
};

} // namespace ExergySim
