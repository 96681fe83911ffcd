#pragma once
#include <variant>

#include "Aggregator.hpp"
#include "Refusal.hpp"
#include "Scenario.hpp"
#include "ScienceConfig.hpp"
#include "StageChain.hpp"
#include "TimeSeries.hpp"

namespace ExergySim {

// Fixed-step axis in the configured time unit: t_k = t0 + k*dt, k in [0, n_steps).
struct TimeAxis {
    double t0      = 0.0;
    double dt      = 1.0;
    int    n_steps = 1;
};

// Result of one run: either the full time series with its balance, or the
// refusal that halted it. A refused run never carries a partial series.
class RunOutcome {
public:
    static RunOutcome completed(TimeSeries series, SystemBalance balance);
    static RunOutcome refused(Refusal refusal);

    bool ok() const { return std::holds_alternative<Completed>(state_); }

    // Throw std::logic_error when called on the wrong alternative.
    const TimeSeries& series() const;
    const SystemBalance& balance() const;
    const Refusal& refusal() const;

private:
    struct Completed {
        TimeSeries series;
        SystemBalance balance;
    };

    explicit RunOutcome(std::variant<Completed, Refusal> state);

    std::variant<Completed, Refusal> state_;
};

class SimulationEngine {
public:
    SimulationEngine(StageChain chain,
                     Scenario scenario,
                     TimeAxis axis,
                     const ScienceConfig& config);

    // Deterministic and side-effect free apart from diagnostics: running the
    // same engine twice yields identical series.
    RunOutcome run() const;

    const StageChain& chain() const { return chain_; }
    const Scenario& scenario() const { return scenario_; }
    const TimeAxis& axis() const { return axis_; }

private:
    void validate_axis_() const;
    void emit_(TimeSeries& out, const TickContext& ctx, const Stage& stage,
               bool first, const StageResult& r) const;

    StageChain chain_;
    Scenario scenario_;
    TimeAxis axis_;
    ScienceConfig config_;
};

} // namespace ExergySim
