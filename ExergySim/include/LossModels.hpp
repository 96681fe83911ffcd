#pragma once
#include <string>

#include "Stage.hpp"

namespace ExergySim {

// Generic, data-parameterized loss models. A technology is described by
// which of these it uses and by the ValueSpecs it feeds them; none of them
// knows which technology it is modelling.
//
// Each model reads its parameters through StageInputs::require, so a missing
// parameter refuses with MissingInput naming the stage.
namespace LossModels {

// Parameter names read by the models below.
constexpr const char* kEfficiency          = "efficiency";           // "-"
constexpr const char* kHeatYield           = "heat_yield";           // "-", may exceed 1
constexpr const char* kOutputTemperature   = "output_temperature";   // K
constexpr const char* kOutputExergyFactor  = "output_exergy_factor"; // "-"
constexpr const char* kLossFractionPerTime = "loss_fraction_per_time_unit"; // "1/<time unit>"
constexpr const char* kHoldDuration        = "hold_duration";        // <time unit>
constexpr const char* kExchangerEfficiency = "exchanger_efficiency"; // "-"

// Output is work: out = efficiency * supplied, exergy = energy.
// The conversion loss is dissipated at ambient and carries no exergy.
LossModel work_output();

// Output is heat at the named temperature input:
//   out = heat_yield * supplied
// heat_yield > 1 draws the difference from the environment as ambient heat
// (zero exergy), heat_yield < 1 dissipates it as a loss at ambient.
// Refuses with InvalidValue when the yield would put more exergy into the
// output than the stage is supplied with (above the Carnot limit).
LossModel heat_output(const std::string& temperature_input = kOutputTemperature);

// Output is a chemical carrier: out = efficiency * supplied,
// exergy = output_exergy_factor * out.
LossModel chemical_output();

// Holding period with a standing loss:
//   retained = (1 - loss_fraction_per_time_unit) ^ hold_duration
// The carrier quality (exergy per unit energy) is unchanged; the lost share
// leaves with its proportional exergy.
LossModel standing_loss();

// Heat handed over at the scenario boundary temperature Tb:
//   out = exchanger_efficiency * supplied, exergy = Ex(out, T0, Tb)
// Refuses with InvalidTemperatureBoundary when the supplied heat has less
// exergy than the heat it would deliver at Tb.
LossModel boundary_delivery();

} // namespace LossModels
} // namespace ExergySim
