#pragma once
#include <functional>
#include <map>
#include <optional>
#include <string>

#include "ScienceConfig.hpp"
#include "TickContext.hpp"
#include "ValueSpec.hpp"

namespace ExergySim {

class Scenario;
class Stage;

// Closed set of generic transformations. Technology differences live in the
// loss model and the stage inputs, never in this enum.
enum class StageKind { Charge, Store, Convert, Deliver };

const char* to_string(StageKind kind);

// Energy and the exergy it carries, both in the configured energy unit.
struct EnergyFlow {
    double energy = 0.0;
    double exergy = 0.0;
};

// Returned by a loss model. Everything here belongs to the stage that
// produced it; nothing is attributed up- or downstream.
struct StageFlows {
    EnergyFlow output;          // primary output, handed to the next stage
    EnergyFlow loss;            // loss dissipated by this stage
    double ambient_heat = 0.0;  // heat drawn from the environment at T0 (no exergy)
};

// Read-only view a loss model works from.
class StageInputs {
public:
    StageInputs(const Stage& stage,
                const Scenario& scenario,
                const ScienceConfig& config,
                const TickContext& tick,
                EnergyFlow inflow,
                double aux_work);

    // Stage input first, then scenario auxiliary input of the same name.
    // Refuses with MissingInput naming the stage when neither exists.
    const ValueSpec& require(const std::string& name) const;
    double value(const std::string& name) const { return require(name).value(); }
    bool has(const std::string& name) const;

    // Inflow from upstream (or the stage's own source for the first stage).
    const EnergyFlow& inflow() const { return inflow_; }

    // Auxiliary work input of this step (0 when the stage declares none).
    double aux_work() const { return aux_work_; }

    // Energy / exergy entering the stage this step.
    double supplied_energy() const { return inflow_.energy + aux_work_; }
    double supplied_exergy() const { return inflow_.exergy + aux_work_; }

    // Exergy of `energy` as heat at temperature T, through ExergyCore
    // (and therefore through the boundary-validity guardrail).
    double heat_exergy(double energy, const ValueSpec& T) const;

    const Stage& stage() const { return stage_; }
    const Scenario& scenario() const { return scenario_; }
    const ScienceConfig& config() const { return config_; }
    const TickContext& tick() const { return tick_; }

private:
    const Stage& stage_;
    const Scenario& scenario_;
    const ScienceConfig& config_;
    TickContext tick_;
    EnergyFlow inflow_;
    double aux_work_;
};

using LossModel = std::function<StageFlows(const StageInputs&)>;

// Full accounting of one stage in one step.
struct StageResult {
    EnergyFlow inflow;
    double     aux_work     = 0.0;
    double     ambient_heat = 0.0;
    EnergyFlow output;
    EnergyFlow loss;
};

// Reserved stage input names.
namespace StageInputNames {
constexpr const char* kEnergyIn            = "energy_in";             // first stage only
constexpr const char* kSourceTemperature   = "source_temperature";    // source delivers heat
constexpr const char* kSourceExergyFactor  = "source_exergy_factor";  // exergy / energy of source
constexpr const char* kAuxWorkIn           = "aux_work_in";           // work per step
} // namespace StageInputNames

class Stage {
public:
    // Refuses with MissingInput for an empty name or an empty loss model, and
    // with MissingProvenance for any untagged input or declared output.
    Stage(StageKind kind,
          std::string name,
          LossModel loss_model,
          std::map<std::string, ValueSpec> inputs = {},
          std::map<std::string, ValueSpec> outputs = {});

    // Copy attributed to a physical component; `required_for_delivery` makes
    // the chain refuse unless the component is inside the scenario boundary.
    Stage for_component(const std::string& component_id, bool required_for_delivery) const;

    StageKind kind() const { return kind_; }
    const std::string& name() const { return name_; }
    const std::map<std::string, ValueSpec>& inputs() const { return inputs_; }
    const std::map<std::string, ValueSpec>& outputs() const { return outputs_; }
    const std::string& component_id() const { return component_id_; }
    bool required_for_delivery() const { return required_for_delivery_; }

    const ValueSpec* find_input(const std::string& name) const;

    // One step. `upstream` is the previous stage's output from the same step;
    // the first stage has none and draws from its own energy_in.
    StageResult evaluate(const Scenario& scenario,
                         const ScienceConfig& config,
                         const TickContext& tick,
                         const std::optional<EnergyFlow>& upstream) const;

private:
    EnergyFlow source_flow_(const Scenario& scenario, const ScienceConfig& config) const;
    double aux_work_(const ScienceConfig& config) const;
    void check_flows_(const StageInputs& in, const StageFlows& flows) const;

    StageKind   kind_;
    std::string name_;
    LossModel   loss_model_;
    std::map<std::string, ValueSpec> inputs_;
    std::map<std::string, ValueSpec> outputs_;
    std::string component_id_;
    bool        required_for_delivery_ = false;
};

} // namespace ExergySim
