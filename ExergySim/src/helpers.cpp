#include "helpers.hpp"
#include "LossModels.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace ExergyHelpers {

using namespace ExergySim;

namespace {

// ---------------------------
// Tiny CLI helpers (no deps)
// ---------------------------
bool arg_eq(const char* a, const char* b) {
  return std::strcmp(a, b) == 0;
}

const char* const kSubstation = "dh_substation";

ValueSpec parameter(double v, const std::string& unit, const std::string& label,
                    const std::string& note) {
  return assumed_value(v, unit, label, note);
}

ValueSpec kelvin(double v, const std::string& label, const std::string& note) {
  return assumed_value(v, "K", label, note);
}

ValueSpec electricity(double v, const std::string& label, const std::string& note) {
  return with_energy_kind(assumed_value(v, "MWh", label, note), EnergyKind::Electric);
}

Stage delivery_stage(double exchanger_efficiency) {
  return Stage(StageKind::Deliver, "deliver_substation", LossModels::boundary_delivery(),
               {{LossModels::kExchangerEfficiency,
                 parameter(exchanger_efficiency, "-", "substation exchanger efficiency",
                           "plate heat exchanger, typical DH substation")}})
      .for_component(kSubstation, true);
}

Stage storage_stage(const std::string& name, double loss_per_hour, double hold_hours,
                    const std::string& note) {
  return Stage(StageKind::Store, name, LossModels::standing_loss(),
               {{LossModels::kLossFractionPerTime,
                 parameter(loss_per_hour, "1/h", name + " standing loss", note)},
                {LossModels::kHoldDuration,
                 parameter(hold_hours, "h", name + " hold duration", "dispatch pattern")}});
}

} // anonymous namespace

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    if (arg_eq(argv[i], "--runs") && i + 1 < argc)         a.runs = std::atoi(argv[++i]);
    else if (arg_eq(argv[i], "--nsteps") && i + 1 < argc)  a.nsteps = std::atoi(argv[++i]);
    else if (arg_eq(argv[i], "--dt") && i + 1 < argc)      a.dt = std::atof(argv[++i]);
    else if (arg_eq(argv[i], "--t0") && i + 1 < argc)      a.T0 = std::atof(argv[++i]);
    else if (arg_eq(argv[i], "--tb") && i + 1 < argc)      a.tb = std::atof(argv[++i]);
    else if (arg_eq(argv[i], "--ts") && i + 1 < argc)      { a.ts = std::atof(argv[++i]); a.glideGiven = true; }
    else if (arg_eq(argv[i], "--tr") && i + 1 < argc)      { a.tr = std::atof(argv[++i]); a.glideGiven = true; }
    else if (arg_eq(argv[i], "--glide") && i + 1 < argc)   a.glide = argv[++i];
    else if (arg_eq(argv[i], "--energy") && i + 1 < argc)  a.energy = std::atof(argv[++i]);
    else if (arg_eq(argv[i], "--help"))                    a.showHelp = true;
  }
  return a;
}

void print_usage() {
  std::cout <<
    "Usage: exergysim [--runs N] [--nsteps N] [--dt hours]\n"
    "                 [--t0 K] [--tb K | --ts K --tr K] [--glide log_mean|arithmetic]\n"
    "                 [--energy MWh]\n"
    "\n"
    "  --t0      reference environment temperature T0 (default 280 K)\n"
    "  --tb      explicit DH boundary temperature; replaces the supply/return glide\n"
    "  --ts/--tr DH supply/return temperatures (default 358.15 / 318.15 K)\n"
    "  --glide   how Tb is derived from the glide (default log_mean)\n"
    "  --energy  electricity drawn by the first stage per step (default 1 MWh)\n"
    "  --runs    independent runs, cycling over the concept catalogue\n"
    "\n"
    "Runs are spread over MPI ranks (run i on rank i mod size). Time series go\n"
    "to $EXERGYSIM_LOG_DIR/$RUN_ID/<run>.csv.\n";
}

ScienceSettings settings_from_args(const Args& args) {
  ScienceSettings s;
  if (args.glide == "log_mean")        s.glide_policy = GlidePolicy::LogMean;
  else if (args.glide == "arithmetic") s.glide_policy = GlidePolicy::Arithmetic;
  else throw std::invalid_argument("Unknown --glide '" + args.glide +
                                   "'. Expected 'log_mean' or 'arithmetic'.");
  return s;
}

Scenario build_scenario(const Args& args, const ScienceConfig& config) {
  ScenarioBuilder b("reference_dh_network");
  b.reference_temperature(kelvin(args.T0, "T0", "annual mean ground/air reference"))
   .delivery_boundary(config.dh_boundary_name())
   .boundary_element(kSubstation, true)
   .boundary_element("dh_network_interface")
   .auxiliary_input(StageInputNames::kSourceExergyFactor,
                    parameter(1.0, "-", "grid electricity exergy factor",
                              "electricity is pure work"));

  // An explicit Tb together with an explicit glide is passed through as
  // given so the builder can refuse it.
  if (args.tb > 0.0) {
    b.boundary_temperature(kelvin(args.tb, "Tb", "command line"));
    if (args.glideGiven) {
      b.supply_return(kelvin(args.ts, "Ts", "command line"), kelvin(args.tr, "Tr", "command line"));
    }
  } else {
    b.supply_return(kelvin(args.ts, "Ts", "DH supply temperature"),
                    kelvin(args.tr, "Tr", "DH return temperature"));
  }
  return b.build(config);
}

std::vector<Concept> concept_catalogue(const Args& args) {
  using namespace LossModels;
  using StageInputNames::kAuxWorkIn;
  using StageInputNames::kEnergyIn;

  const ValueSpec energy_in = electricity(args.energy, "grid electricity", "dispatch per step");

  std::vector<Concept> out;

  // Electric boiler charging a hot water tank.
  {
    StageChainBuilder c("electric_boiler_tank");
    c.append(Stage(StageKind::Charge, "charge_boiler", heat_output(),
                   {{kEnergyIn, energy_in},
                    {kHeatYield, parameter(0.99, "-", "boiler efficiency", "resistive boiler")},
                    {kOutputTemperature, kelvin(363.15, "tank charge temperature", "tank top")}}))
     .append(storage_stage("store_tank", 0.002, 12.0, "insulated steel tank"))
     .append(delivery_stage(0.97));
    out.push_back({"electric_boiler_tank", c});
  }

  // Same tank held for a week; a revision of the chain above.
  {
    StageChainBuilder c = out.front().chain;
    c.replace(storage_stage("store_tank", 0.002, 168.0, "insulated steel tank"));
    out.push_back({"electric_boiler_tank_weekly", c});
  }

  // Heat pump into a borehole field, lifted to supply temperature by a booster.
  {
    StageChainBuilder c("heat_pump_borehole");
    c.append(Stage(StageKind::Charge, "charge_heat_pump", heat_output(),
                   {{kEnergyIn, energy_in},
                    {kHeatYield, parameter(3.2, "-", "heat pump COP", "seasonal performance")},
                    {kOutputTemperature, kelvin(323.15, "borehole charge temperature", "design")}}))
     .append(storage_stage("store_borehole", 0.0005, 720.0, "seasonal borehole storage"))
     .append(Stage(StageKind::Convert, "convert_booster", heat_output(),
                   {{kHeatYield, parameter(1.0, "-", "booster heat yield", "electric booster")},
                    {kAuxWorkIn, electricity(0.4 * args.energy, "booster electricity",
                                             "lift to supply temperature")},
                    {kOutputTemperature, kelvin(353.15, "booster outlet temperature", "design")}}))
     .append(delivery_stage(0.97));
    out.push_back({"heat_pump_borehole", c});
  }

  // Power-to-gas with a gas boiler at the network.
  {
    StageChainBuilder c("power_to_gas");
    c.append(Stage(StageKind::Charge, "charge_electrolyser", chemical_output(),
                   {{kEnergyIn, energy_in},
                    {kEfficiency, parameter(0.70, "-", "electrolyser efficiency", "PEM, LHV")},
                    {kOutputExergyFactor, parameter(0.94, "-", "hydrogen exergy factor",
                                                    "chemical exergy / LHV")}}))
     .append(storage_stage("store_cavern", 0.0001, 720.0, "salt cavern"))
     .append(Stage(StageKind::Convert, "convert_gas_boiler", heat_output(),
                   {{kHeatYield, parameter(0.92, "-", "gas boiler efficiency", "condensing")},
                    {kOutputTemperature, kelvin(363.15, "boiler outlet temperature", "design")}}))
     .append(delivery_stage(0.97));
    out.push_back({"power_to_gas", c});
  }

  return out;
}

std::string pack_notes(const std::map<int, std::string>& notes) {
  std::string out;
  for (const auto& kv : notes) {
    out += std::to_string(kv.first);
    out += '\t';
    out += kv.second;
    out += '\0';
  }
  return out;
}

std::map<int, std::string> unpack_notes(const std::string& buffer) {
  std::map<int, std::string> notes;
  std::size_t pos = 0;
  while (pos < buffer.size()) {
    std::size_t end = buffer.find('\0', pos);
    if (end == std::string::npos) end = buffer.size();
    const std::size_t tab = buffer.find('\t', pos);
    if (tab == std::string::npos || tab > end) {
      throw std::runtime_error("unpack_notes: malformed note at offset " + std::to_string(pos));
    }
    notes[std::atoi(buffer.substr(pos, tab - pos).c_str())] = buffer.substr(tab + 1, end - tab - 1);
    pos = end + 1;
  }
  return notes;
}

} // namespace ExergyHelpers
