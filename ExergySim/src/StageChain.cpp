#include "StageChain.hpp"
#include "Guardrails.hpp"
#include "Refusal.hpp"

#include <utility>

namespace ExergySim {

// ---------------- StageChain ----------------

StageChain::StageChain(std::string name, std::vector<Stage> stages)
    : name_(std::move(name)), stages_(std::move(stages)) {}

StageChainBuilder StageChain::revise() const {
    StageChainBuilder b(name_);
    for (const auto& s : stages_) b.append(s);
    return b;
}

// ---------------- StageChainBuilder ----------------

StageChainBuilder::StageChainBuilder(std::string name) : name_(std::move(name)) {}

StageChainBuilder& StageChainBuilder::append(Stage stage) {
    stages_.push_back(std::move(stage));
    return *this;
}

StageChainBuilder& StageChainBuilder::replace(Stage stage) {
    for (auto& s : stages_) {
        if (s.name() == stage.name()) {
            s = std::move(stage);
            return *this;
        }
    }
    Refusal r;
    r.kind    = RefusalKind::MissingInput;
    r.code    = "REFUSE_STAGE_NOT_FOUND";
    r.field   = "stage.name";
    r.stage   = stage.name();
    r.message = "Cannot replace stage '" + stage.name() + "' in chain '" + name_ +
                "' because no stage of that name exists.";
    r.why     = "A revision can only replace a stage that is part of the chain.";
    throw RefusalError(std::move(r));
}

StageChain StageChainBuilder::finalize(const Scenario& scenario) const {
    Guardrails::require_non_empty(name_, "stage_chain.name");
    Guardrails::require_chain_terminates_in_delivery(stages_);
    Guardrails::require_unique_stage_names(stages_);

    for (std::size_t i = 1; i < stages_.size(); ++i) {
        if (stages_[i].find_input(StageInputNames::kEnergyIn) == nullptr) continue;
        Refusal r;
        r.kind    = RefusalKind::InvalidValue;
        r.code    = "REFUSE_ENERGY_IN_NOT_FIRST";
        r.field   = std::string("stage.inputs.") + StageInputNames::kEnergyIn;
        r.stage   = stages_[i].name();
        r.message = "Stage '" + stages_[i].name() + "' declares " + StageInputNames::kEnergyIn +
                    " but is fed by the stage before it.";
        r.why     = "Only the first stage draws from an external source; later stages are fed "
                    "by their upstream stage, otherwise energy enters the balance twice.";
        throw RefusalError(std::move(r));
    }

    Guardrails::require_boundary_completeness(scenario, stages_);

    return StageChain(name_, stages_);
}

} // namespace ExergySim
