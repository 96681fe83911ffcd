// ExergySim/src/main.cpp
// mpirun -np 4 ./build/exergysim
/**
Build (from repo root):
  rm -rf build && mkdir build && cd build
  cmake -DCMAKE_BUILD_TYPE=Release ..
  cmake --build . -j

Run (from build/):
  mpirun -np 4 ./exergysim                                   // concept catalogue, default scenario
  mpirun -np 4 ./exergysim --nsteps 168 --dt 1 --glide arithmetic
  mpirun -np 2 ./exergysim --tb 343.15 --runs 8
  RUN_ID=winter EXERGYSIM_LOG_DIR=/tmp/exergy ./exergysim --t0 268.15
*/

#include <mpi.h>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "Logger.hpp"
#include "SimulationEngine.hpp"
#include "helpers.hpp"

using ExergyHelpers::Args;
using ExergyHelpers::Concept;
using ExergyHelpers::parse_args;
using ExergyHelpers::print_usage;

using namespace ExergySim;

namespace {

// Per-run summary slots reduced to rank 0. Each run is filled in by exactly
// one rank and is zero everywhere else, so MPI_SUM assembles the table.
enum SummarySlot {
  kOwned = 0,
  kOutcome,            // 0 = completed, 1 + RefusalKind otherwise
  kDeliveredHeat,
  kDeliveredExergy,
  kInputExergy,
  kDestruction,
  kEfficiency,
  kInputPerUnit,       // -1 when no heat was delivered
  kSummarySlots
};

RefusalKind kind_from_outcome(double code) {
  return static_cast<RefusalKind>(static_cast<int>(code) - 1);
}

} // anonymous namespace

int main(int argc, char** argv) {
  MPI_Init(&argc, &argv);

  int rank = 0, size = 1;
  MPI_Comm_rank(MPI_COMM_WORLD, &rank);
  MPI_Comm_size(MPI_COMM_WORLD, &size);

  Logger& logger = Logger::instance();
  logger.set_rank(rank);

  auto log_msg = [&](Logger::Level level, const std::string& text) {
    logger.message(level, text);
  };

  try {
    Args args = parse_args(argc, argv);
    if (args.showHelp) {
      if (rank == 0) print_usage();
      MPI_Finalize();
      return EXIT_SUCCESS;
    }

    const ScienceConfig& config = ScienceConfig::freeze(ExergyHelpers::settings_from_args(args));

    // The scenario is built identically on every rank; a refusal here ends
    // the whole job.
    std::optional<Scenario> scenario;
    try {
      scenario = ExergyHelpers::build_scenario(args, config);
    } catch (const RefusalError& e) {
      if (rank == 0) {
        log_msg(Logger::Level::Refuse, "scenario: " + e.refusal().describe());
        if (!e.refusal().why.empty()) log_msg(Logger::Level::Info, "  why: " + e.refusal().why);
      }
      MPI_Finalize();
      return EXIT_FAILURE;
    }

    if (rank == 0) {
      std::ostringstream oss;
      oss << "scenario '" << scenario->name() << "': T0=" << scenario->T0().value()
          << " K, Tb=" << scenario->Tb().value() << " K (" << scenario->Tb().describe()
          << "), " << size << " rank(s)";
      log_msg(Logger::Level::Info, oss.str());
    }

    const std::vector<Concept> catalogue = ExergyHelpers::concept_catalogue(args);
    const int nruns = args.runs > 0 ? args.runs : static_cast<int>(catalogue.size());

    const TimeAxis axis{0.0, args.dt, args.nsteps};

    std::vector<std::string> run_names(nruns);
    std::vector<double> local(static_cast<std::size_t>(nruns) * kSummarySlots, 0.0);
    std::map<int, std::string> notes;   // refusal text of the runs owned here

    for (int i = 0; i < nruns; ++i) {
      const Concept& c = catalogue[i % catalogue.size()];
      run_names[i] = args.runs > 0 ? c.name + "_run" + std::to_string(i) : c.name;
      if (i % size != rank) continue;

      double* slot = &local[static_cast<std::size_t>(i) * kSummarySlots];
      slot[kOwned] = 1.0;

      const RunOutcome outcome = [&]() {
        try {
          SimulationEngine engine(c.chain.finalize(*scenario), *scenario, axis, config);
          return engine.run();
        } catch (const RefusalError& e) {
          // Finalization refused; the engine never started.
          log_msg(Logger::Level::Refuse, "run '" + run_names[i] + "': " + e.refusal().describe());
          return RunOutcome::refused(e.refusal());
        }
      }();

      if (!outcome.ok()) {
        slot[kOutcome] = 1.0 + static_cast<int>(outcome.refusal().kind);
        notes[i] = outcome.refusal().describe();
        continue;
      }

      logger.log(run_names[i], outcome.series());

      const SystemBalance& b = outcome.balance();
      slot[kDeliveredHeat]   = b.delivered_heat;
      slot[kDeliveredExergy] = b.delivered_exergy;
      slot[kInputExergy]     = b.system_input_exergy;
      slot[kDestruction]     = b.total_destruction;
      slot[kEfficiency]      = b.efficiency;
      slot[kInputPerUnit]    = b.input_exergy_per_functional_unit.value_or(-1.0);
    }

    std::vector<double> table(local.size(), 0.0);
    MPI_Reduce(local.data(), table.data(), static_cast<int>(local.size()),
               MPI_DOUBLE, MPI_SUM, 0, MPI_COMM_WORLD);

    // Refusal text only exists on the owning rank; gather it for the table.
    const std::string packed = ExergyHelpers::pack_notes(notes);
    int packed_len = static_cast<int>(packed.size());
    std::vector<int> lens(rank == 0 ? size : 0);
    MPI_Gather(&packed_len, 1, MPI_INT, lens.data(), 1, MPI_INT, 0, MPI_COMM_WORLD);

    std::vector<int> displs(lens.size(), 0);
    int total_len = 0;
    for (std::size_t r = 0; r < lens.size(); ++r) {
      displs[r] = total_len;
      total_len += lens[r];
    }
    std::string gathered(static_cast<std::size_t>(total_len), '\0');
    MPI_Gatherv(packed.data(), packed_len, MPI_CHAR,
                rank == 0 ? &gathered[0] : nullptr, lens.data(), displs.data(), MPI_CHAR,
                0, MPI_COMM_WORLD);

    int integrity_failures = 0;
    if (rank == 0) {
      const std::map<int, std::string> all_notes = ExergyHelpers::unpack_notes(gathered);

      std::ostringstream oss;
      oss << std::left << std::setw(34) << "run"
          << std::right << std::setw(12) << "heat"
          << std::setw(12) << "Ex_deliv"
          << std::setw(12) << "Ex_input"
          << std::setw(12) << "Ex_destr"
          << std::setw(10) << "eta_ex"
          << std::setw(14) << "Ex_in/FU" << "  [" << config.energy_unit() << "]\n";

      oss << std::fixed;
      for (int i = 0; i < nruns; ++i) {
        const double* slot = &table[static_cast<std::size_t>(i) * kSummarySlots];
        oss << std::left << std::setw(34) << run_names[i] << std::right;
        if (slot[kOutcome] > 0.0) {
          const RefusalKind kind = kind_from_outcome(slot[kOutcome]);
          if (kind == RefusalKind::ComputationIntegrityFailure) ++integrity_failures;
          const auto note = all_notes.find(i);
          oss << "  REFUSED "
              << (note != all_notes.end() ? note->second : std::string(to_string(kind))) << '\n';
          continue;
        }
        oss << std::setprecision(4)
            << std::setw(12) << slot[kDeliveredHeat]
            << std::setw(12) << slot[kDeliveredExergy]
            << std::setw(12) << slot[kInputExergy]
            << std::setw(12) << slot[kDestruction]
            << std::setw(10) << slot[kEfficiency];
        if (slot[kInputPerUnit] < 0.0) oss << std::setw(14) << "n/a";
        else                           oss << std::setw(14) << slot[kInputPerUnit];
        oss << '\n';
      }
      std::cout << oss.str() << std::flush;

      if (integrity_failures > 0) {
        log_msg(Logger::Level::Integrity,
                std::to_string(integrity_failures) + " run(s) failed an accounting identity");
      }
    }

    MPI_Bcast(&integrity_failures, 1, MPI_INT, 0, MPI_COMM_WORLD);
    MPI_Barrier(MPI_COMM_WORLD);
    MPI_Finalize();
    return integrity_failures > 0 ? EXIT_FAILURE : EXIT_SUCCESS;
  }
  catch (const std::exception& e) {
    std::ostringstream oss;
    oss << "std::exception on rank " << rank << ": " << e.what();
    log_msg(Logger::Level::Fatal, oss.str());
    MPI_Abort(MPI_COMM_WORLD, 1);
    return EXIT_FAILURE;
  }
}
