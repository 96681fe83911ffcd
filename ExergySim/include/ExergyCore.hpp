#pragma once
#include <string>

#include "ScienceConfig.hpp"
#include "ValueSpec.hpp"

namespace ExergySim {

// Pure exergy functions. Inputs arrive already normalized: temperatures in K,
// energies in one consistent unit. Nothing here converts units.
namespace ExergyCore {

// Ex = Q * (1 - T0/Tb)
//
// Runs the boundary-validity guardrail first, so Tb <= T0 refuses with
// InvalidTemperatureBoundary before any arithmetic. Also refuses when
// T0/Tb are not in K or not positive, when Q < 0, and when Q is a Wh-family
// quantity without a declared energy kind. The result is a derived ValueSpec
// in Q's unit.
ValueSpec exergy_of_heat(const ValueSpec& Q, const ValueSpec& T0, const ValueSpec& Tb);

// eta = Ex_out / Ex_in, unit "-". ZeroInputExergy when Ex_in <= 0;
// UnitMismatch when the two exergies are not in the same unit.
ValueSpec exergy_efficiency(const ValueSpec& ex_out, const ValueSpec& ex_in);

// Plausible range of a system exergy efficiency, [0, 1.2]. The margin above 1
// leaves room for rounding in the inputs; anything outside points at the data.
constexpr double kEfficiencyMin = 0.0;
constexpr double kEfficiencyMax = 1.2;
bool efficiency_in_range(double eta);

// Representative boundary temperature of a supply/return glide.
// Refuses with InvalidTemperatureBoundary when Ts < Tr. When Ts == Tr the
// glide has collapsed and Ts itself is returned (as a derived value).
ValueSpec boundary_temperature_from_glide(const ValueSpec& Ts,
                                          const ValueSpec& Tr,
                                          GlidePolicy policy);

} // namespace ExergyCore

// System-level summary of one completed run. Only produced by the Aggregator.
struct ExergyResult {
    double exergy_value = 0.0;  // delivered exergy
    double efficiency   = 0.0;  // delivered / system input
    double destruction  = 0.0;  // sum of per-stage destruction
    std::string unit;
};

} // namespace ExergySim
