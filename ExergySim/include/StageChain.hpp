#pragma once
#include <string>
#include <vector>

#include "Scenario.hpp"
#include "Stage.hpp"

namespace ExergySim {

class StageChainBuilder;

// Ordered, finalized sequence of stages ending in DELIVER. Immutable: a
// structural change goes through revise() and yields a second chain, so the
// prior and revised configurations can be run side by side.
class StageChain {
public:
    const std::string& name() const { return name_; }
    const std::vector<Stage>& stages() const { return stages_; }
    std::size_t size() const { return stages_.size(); }

    const Stage& delivery_stage() const { return stages_.back(); }

    StageChainBuilder revise() const;

private:
    friend class StageChainBuilder;
    StageChain(std::string name, std::vector<Stage> stages);

    std::string name_;
    std::vector<Stage> stages_;
};

// Phase 1: append stages in physical order. Phase 2: finalize() against the
// scenario the chain will run in.
class StageChainBuilder {
public:
    explicit StageChainBuilder(std::string name);

    StageChainBuilder& append(Stage stage);

    // Replaces the stage with the same name (revision helper).
    StageChainBuilder& replace(Stage stage);

    // Refuses with IncompleteChain (empty, or last kind != DELIVER),
    // InvalidValue (duplicate stage names, energy_in on a non-first stage),
    // MissingBoundaryElement (required component outside the boundary).
    StageChain finalize(const Scenario& scenario) const;

    const std::string& name() const { return name_; }
    std::size_t size() const { return stages_.size(); }

private:
    std::string name_;
    std::vector<Stage> stages_;
};

} // namespace ExergySim
