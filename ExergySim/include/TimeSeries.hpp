#pragma once
#include <string>
#include <vector>

#include "ValueSpec.hpp"

namespace ExergySim {

// One observed quantity of one stage at one step.
struct TimeSeriesRecord {
    double      time  = 0.0;
    int         step  = 0;
    std::string stage;
    std::string variable;
    double      value = 0.0;
    std::string unit;
    SourceType  source_type = SourceType::Derived;
};

// Append-only; ordered by step, then chain position, then the per-stage
// variable order below.
using TimeSeries = std::vector<TimeSeriesRecord>;

// Variables emitted for every stage on every step, in this order. Declared
// stage outputs follow them.
namespace Variables {
constexpr const char* kEnergyIn     = "energy_in";
constexpr const char* kExergyIn     = "exergy_in";
constexpr const char* kAuxWorkIn    = "aux_work_in";
constexpr const char* kAmbientHeat  = "ambient_heat_in";
constexpr const char* kEnergyOut    = "energy_out";
constexpr const char* kExergyOut    = "exergy_out";
constexpr const char* kEnergyLoss   = "energy_loss";
constexpr const char* kExergyLoss   = "exergy_loss";
} // namespace Variables

} // namespace ExergySim
