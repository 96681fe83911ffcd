#include "Stage.hpp"
#include "ExergyCore.hpp"
#include "Guardrails.hpp"
#include "Refusal.hpp"
#include "Scenario.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace ExergySim {

namespace {

const ValueSpec* lookup(const Stage& stage, const Scenario& scenario, const std::string& name) {
    if (const ValueSpec* v = stage.find_input(name)) return v;
    return scenario.find_auxiliary(name);
}

void require_energy(const ValueSpec& v, const ScienceConfig& config, const std::string& field) {
    Guardrails::require_unit(v, config.energy_unit(), field);
    Guardrails::require_unambiguous_energy(v, field);
    Guardrails::require_non_negative(v, field);
}

} // anonymous namespace

const char* to_string(StageKind kind) {
    switch (kind) {
        case StageKind::Charge:  return "CHARGE";
        case StageKind::Store:   return "STORE";
        case StageKind::Convert: return "CONVERT";
        case StageKind::Deliver: return "DELIVER";
    }
    return "UNKNOWN";
}

// ---------------- StageInputs ----------------

StageInputs::StageInputs(const Stage& stage,
                         const Scenario& scenario,
                         const ScienceConfig& config,
                         const TickContext& tick,
                         EnergyFlow inflow,
                         double aux_work)
    : stage_(stage),
      scenario_(scenario),
      config_(config),
      tick_(tick),
      inflow_(inflow),
      aux_work_(aux_work) {}

const ValueSpec& StageInputs::require(const std::string& name) const {
    return Guardrails::require_present(lookup(stage_, scenario_, name), "stage.inputs." + name);
}

bool StageInputs::has(const std::string& name) const {
    return lookup(stage_, scenario_, name) != nullptr;
}

double StageInputs::heat_exergy(double energy, const ValueSpec& T) const {
    const ValueSpec Q = derived_value(energy, config_.energy_unit(),
                                      stage_.name() + ".heat", "loss_model",
                                      EnergyKind::Thermal);
    return ExergyCore::exergy_of_heat(Q, scenario_.T0(), T).value();
}

// ---------------- Stage ----------------

Stage::Stage(StageKind kind,
             std::string name,
             LossModel loss_model,
             std::map<std::string, ValueSpec> inputs,
             std::map<std::string, ValueSpec> outputs)
    : kind_(kind),
      name_(std::move(name)),
      loss_model_(std::move(loss_model)),
      inputs_(std::move(inputs)),
      outputs_(std::move(outputs)) {
    Guardrails::require_non_empty(name_, "stage.name");
    if (!loss_model_) {
        Refusal r;
        r.kind    = RefusalKind::MissingInput;
        r.code    = "REFUSE_LOSS_MODEL_MISSING";
        r.field   = "stage.loss_model";
        r.stage   = name_;
        r.message = "Cannot build stage '" + name_ + "' because it has no loss model.";
        r.why     = "Every stage must state explicitly how it loses energy.";
        throw RefusalError(std::move(r));
    }
    for (const auto& kv : inputs_)  Guardrails::require_provenance(kv.second);
    for (const auto& kv : outputs_) Guardrails::require_provenance(kv.second);
}

Stage Stage::for_component(const std::string& component_id, bool required_for_delivery) const {
    Guardrails::require_non_empty(component_id, "stage.component_id");
    Stage copy = *this;
    copy.component_id_          = component_id;
    copy.required_for_delivery_ = required_for_delivery;
    return copy;
}

const ValueSpec* Stage::find_input(const std::string& name) const {
    auto it = inputs_.find(name);
    return it == inputs_.end() ? nullptr : &it->second;
}

StageResult Stage::evaluate(const Scenario& scenario,
                            const ScienceConfig& config,
                            const TickContext& tick,
                            const std::optional<EnergyFlow>& upstream) const {
    const EnergyFlow inflow = upstream ? *upstream : source_flow_(scenario, config);
    const double aux = aux_work_(config);

    StageInputs in(*this, scenario, config, tick, inflow, aux);
    const StageFlows flows = loss_model_(in);
    check_flows_(in, flows);

    StageResult r;
    r.inflow       = inflow;
    r.aux_work     = aux;
    r.ambient_heat = flows.ambient_heat;
    r.output       = flows.output;
    r.loss         = flows.loss;
    return r;
}

EnergyFlow Stage::source_flow_(const Scenario& scenario, const ScienceConfig& config) const {
    using namespace StageInputNames;

    const ValueSpec& e_in = Guardrails::require_present(find_input(kEnergyIn),
                                                        std::string("stage.inputs.") + kEnergyIn);
    require_energy(e_in, config, kEnergyIn);

    EnergyFlow f;
    f.energy = e_in.value();

    // Heat source: quality follows from its temperature. Otherwise the source
    // must state its exergy content explicitly.
    if (const ValueSpec* T = lookup(*this, scenario, kSourceTemperature)) {
        const ValueSpec Q = with_energy_kind(e_in, EnergyKind::Thermal);
        f.exergy = ExergyCore::exergy_of_heat(Q, scenario.T0(), *T).value();
        return f;
    }

    const ValueSpec& factor = Guardrails::require_present(
        lookup(*this, scenario, kSourceExergyFactor),
        std::string("stage.inputs.") + kSourceExergyFactor);
    Guardrails::require_unit(factor, "-", kSourceExergyFactor);
    Guardrails::require_fraction(factor, kSourceExergyFactor);
    f.exergy = factor.value() * f.energy;
    return f;
}

double Stage::aux_work_(const ScienceConfig& config) const {
    const ValueSpec* w = find_input(StageInputNames::kAuxWorkIn);
    if (w == nullptr) return 0.0;
    require_energy(*w, config, StageInputNames::kAuxWorkIn);
    return w->value();
}

void Stage::check_flows_(const StageInputs& in, const StageFlows& flows) const {
    const std::pair<const char*, double> terms[] = {
        {"output.energy", flows.output.energy},
        {"output.exergy", flows.output.exergy},
        {"loss.energy",   flows.loss.energy},
        {"loss.exergy",   flows.loss.exergy},
        {"ambient_heat",  flows.ambient_heat},
    };
    for (const auto& t : terms) {
        if (std::isfinite(t.second) && t.second >= 0.0) continue;

        std::ostringstream oss;
        oss << "Loss model of stage '" << name_ << "' returned " << t.first << " = "
            << t.second << " at step " << in.tick().tick_index << '.';
        Refusal r;
        r.kind    = RefusalKind::ComputationIntegrityFailure;
        r.code    = "INTEGRITY_LOSS_MODEL_OUTPUT";
        r.field   = t.first;
        r.stage   = name_;
        r.message = oss.str();
        r.why     = "Loss models must return finite, non-negative flows.";
        throw RefusalError(std::move(r));
    }
}

} // namespace ExergySim
