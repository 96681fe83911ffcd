#pragma once
#include <optional>
#include <string>
#include <vector>

#include "ExergyCore.hpp"
#include "ScienceConfig.hpp"
#include "TimeSeries.hpp"

namespace ExergySim {

// Totals of one stage over the whole run.
struct StageBalance {
    std::string stage;
    double energy_in    = 0.0;
    double exergy_in    = 0.0;
    double aux_work     = 0.0;
    double ambient_heat = 0.0;
    double energy_out   = 0.0;
    double exergy_out   = 0.0;
    double energy_loss  = 0.0;
    double exergy_loss  = 0.0;

    // exergy_in + aux_work - exergy_out: all exergy entering the stage that
    // is not passed on. Exergy leaving with the loss stream is dissipated in
    // the environment and is therefore part of it.
    double destruction  = 0.0;

    // destruction - exergy_loss: the part destroyed inside the stage.
    double internal_destruction = 0.0;
};

struct SystemBalance {
    std::string unit;
    int steps = 0;
    std::vector<StageBalance> stages;   // chain order

    double system_input_exergy = 0.0;   // first stage exergy_in + all aux work
    double delivered_exergy    = 0.0;   // last stage exergy_out
    double delivered_heat      = 0.0;   // last stage energy_out
    double total_destruction   = 0.0;
    double total_loss_exergy   = 0.0;
    double efficiency          = 0.0;   // delivered / system input
    bool   efficiency_in_range = true;  // see ExergyCore::efficiency_in_range

    // system_input - (delivered + total_destruction); within tolerance.
    double residual = 0.0;

    // System input exergy needed per functional unit of delivered heat.
    // Empty when no heat was delivered.
    std::optional<double> input_exergy_per_functional_unit;

    ExergyResult result() const;
};

namespace Aggregator {

// Rolls the time series of one run into stage and system balances.
//
// Refuses with ComputationIntegrityFailure (never a physical-validity kind)
// when the series breaks an accounting identity: a record is missing or in
// the wrong unit, a stage violates its energy balance or destroys negative
// exergy, a stage is not fed exactly what its upstream stage produced, or
//   system_input_exergy == delivered_exergy + sum(destruction)
// does not hold within the configured tolerance. Refuses with
// ZeroInputExergy when the system received no exergy at all.
//
// An efficiency outside ExergyCore::efficiency_in_range is not refused; it
// is flagged on the balance and logged as a warning.
SystemBalance aggregate(const TimeSeries& series, const ScienceConfig& config);

} // namespace Aggregator
} // namespace ExergySim
