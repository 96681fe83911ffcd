#pragma once

#include <map>
#include <string>
#include <vector>

#include "Scenario.hpp"
#include "ScienceConfig.hpp"
#include "StageChain.hpp"

namespace ExergyHelpers {

// ---------------------------
// CLI arguments / config
// ---------------------------
struct Args {
  int    runs     = -1;        // independent runs; -1 = one per concept
  int    nsteps   = 24;        // steps per run
  double dt       = 1.0;       // hours per step
  double T0       = 280.0;     // reference environment temperature (K)
  double tb       = -1.0;      // explicit boundary temperature (K); <= 0 = use glide
  double ts       = 358.15;    // DH supply temperature (K)
  double tr       = 318.15;    // DH return temperature (K)
  bool   glideGiven = false;   // --ts or --tr was passed explicitly
  std::string glide = "log_mean";
  double energy   = 1.0;       // MWh drawn by the first stage per step
  bool   showHelp = false;
};

Args parse_args(int argc, char** argv);
void print_usage();

// Throws std::invalid_argument for an unknown --glide value.
ExergySim::ScienceSettings settings_from_args(const Args& args);

// Reference scenario for the concept comparison. Refuses through the
// scenario guardrails like any other scenario.
ExergySim::Scenario build_scenario(const Args& args, const ExergySim::ScienceConfig& config);

// One storage/conversion concept, described purely by generic stages and
// their parameters.
struct Concept {
  std::string name;
  ExergySim::StageChainBuilder chain;
};

std::vector<Concept> concept_catalogue(const Args& args);

// ---------------------------
// Refusal notes for rank 0
// ---------------------------
// Each refused run travels as "<run index>\t<text>\0". Buffers from several
// ranks can be concatenated and still unpack to the union of their notes.
std::string pack_notes(const std::map<int, std::string>& notes);
std::map<int, std::string> unpack_notes(const std::string& buffer);

} // namespace ExergyHelpers
