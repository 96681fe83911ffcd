#include "SimulationEngine.hpp"
#include "Guardrails.hpp"
#include "Logger.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace ExergySim {

// ---------------- RunOutcome ----------------

RunOutcome::RunOutcome(std::variant<Completed, Refusal> state) : state_(std::move(state)) {}

RunOutcome RunOutcome::completed(TimeSeries series, SystemBalance balance) {
    return RunOutcome(Completed{std::move(series), std::move(balance)});
}

RunOutcome RunOutcome::refused(Refusal refusal) {
    return RunOutcome(std::move(refusal));
}

const TimeSeries& RunOutcome::series() const {
    if (!ok()) throw std::logic_error("RunOutcome: refused run has no time series");
    return std::get<Completed>(state_).series;
}

const SystemBalance& RunOutcome::balance() const {
    if (!ok()) throw std::logic_error("RunOutcome: refused run has no balance");
    return std::get<Completed>(state_).balance;
}

const Refusal& RunOutcome::refusal() const {
    if (ok()) throw std::logic_error("RunOutcome: completed run has no refusal");
    return std::get<Refusal>(state_);
}

// ---------------- SimulationEngine ----------------

SimulationEngine::SimulationEngine(StageChain chain,
                                   Scenario scenario,
                                   TimeAxis axis,
                                   const ScienceConfig& config)
    : chain_(std::move(chain)),
      scenario_(std::move(scenario)),
      axis_(axis),
      config_(config) {}

void SimulationEngine::validate_axis_() const {
    Guardrails::require_finite(axis_.t0, "time_axis.t0");
    Guardrails::require_positive(
        assumed_value(axis_.dt, config_.time_unit(), "time_axis.dt", "fixed step of the run"),
        "time_axis.dt");
    if (axis_.n_steps < 1) {
        Refusal r;
        r.kind    = RefusalKind::InvalidValue;
        r.code    = "REFUSE_TIME_AXIS_EMPTY";
        r.field   = "time_axis.n_steps";
        r.message = "Time axis has " + std::to_string(axis_.n_steps) +
                    " steps; at least one is required.";
        r.why     = "A run without steps has no balance to report.";
        throw RefusalError(std::move(r));
    }
}

void SimulationEngine::emit_(TimeSeries& out, const TickContext& ctx, const Stage& stage,
                             bool first, const StageResult& r) const {
    const std::string& unit = config_.energy_unit();

    auto push = [&](const char* variable, double value, SourceType type) {
        out.push_back(TimeSeriesRecord{ctx.time, ctx.tick_index, stage.name(),
                                       variable, value, unit, type});
    };

    SourceType in_type = SourceType::Derived;
    if (first) {
        if (const ValueSpec* e = stage.find_input(StageInputNames::kEnergyIn)) {
            in_type = e->source_type();
        }
    }
    SourceType aux_type = SourceType::Derived;
    if (const ValueSpec* w = stage.find_input(StageInputNames::kAuxWorkIn)) {
        aux_type = w->source_type();
    }

    push(Variables::kEnergyIn,    r.inflow.energy, in_type);
    push(Variables::kExergyIn,    r.inflow.exergy, SourceType::Derived);
    push(Variables::kAuxWorkIn,   r.aux_work,      aux_type);
    push(Variables::kAmbientHeat, r.ambient_heat,  SourceType::Derived);
    push(Variables::kEnergyOut,   r.output.energy, SourceType::Derived);
    push(Variables::kExergyOut,   r.output.exergy, SourceType::Derived);
    push(Variables::kEnergyLoss,  r.loss.energy,   SourceType::Derived);
    push(Variables::kExergyLoss,  r.loss.exergy,   SourceType::Derived);

    for (const auto& [name, spec] : stage.outputs()) {
        out.push_back(TimeSeriesRecord{ctx.time, ctx.tick_index, stage.name(),
                                       name, spec.value(), spec.unit(), spec.source_type()});
    }
}

RunOutcome SimulationEngine::run() const {
    TimeSeries series;
    int step = -1;
    std::string stage_name;

    try {
        validate_axis_();
        // The chain may have been finalized against another scenario.
        Guardrails::require_boundary_completeness(scenario_, chain_.stages());

        series.reserve(static_cast<std::size_t>(axis_.n_steps) * chain_.size() * 8);

        for (int k = 0; k < axis_.n_steps; ++k) {
            step = k;
            const TickContext ctx{ k, axis_.t0 + k * axis_.dt, axis_.dt };

            std::optional<EnergyFlow> upstream;
            bool first = true;
            for (const auto& stage : chain_.stages()) {
                stage_name = stage.name();
                const StageResult r = stage.evaluate(scenario_, config_, ctx, upstream);
                emit_(series, ctx, stage, first, r);
                upstream = r.output;
                first = false;
            }
        }

        step = -1;
        stage_name.clear();
        SystemBalance balance = Aggregator::aggregate(series, config_);
        return RunOutcome::completed(std::move(series), std::move(balance));
    } catch (const RefusalError& e) {
        const RefusalError located = step >= 0 ? e.at(step, stage_name) : e;
        const Refusal& r = located.refusal();

        Logger::instance().message(
            r.is_integrity_failure() ? Logger::Level::Integrity : Logger::Level::Refuse,
            "chain '" + chain_.name() + "' in scenario '" + scenario_.name() + "': " +
                r.describe() + (r.why.empty() ? std::string() : " (" + r.why + ")"));

        return RunOutcome::refused(r);
    }
}

} // namespace ExergySim
