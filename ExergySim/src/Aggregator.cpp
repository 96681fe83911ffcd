#include "Aggregator.hpp"
#include "ExergyCore.hpp"
#include "Logger.hpp"
#include "Refusal.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <sstream>
#include <utility>

namespace ExergySim {

namespace {

// Accounting variables in TimeSeries order; declared stage outputs are
// carried in the series but take no part in the balance.
const char* const kSlots[] = {
    Variables::kEnergyIn,   Variables::kExergyIn,  Variables::kAuxWorkIn,
    Variables::kAmbientHeat, Variables::kEnergyOut, Variables::kExergyOut,
    Variables::kEnergyLoss, Variables::kExergyLoss,
};
constexpr int kSlotCount = 8;

enum Slot { EnergyIn, ExergyIn, AuxWork, AmbientHeat, EnergyOut, ExergyOut, EnergyLoss, ExergyLoss };

struct StepValues {
    double time = 0.0;
    double v[kSlotCount] = {0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
    unsigned seen = 0u;
};

int slot_of(const std::string& variable) {
    for (int i = 0; i < kSlotCount; ++i) {
        if (variable == kSlots[i]) return i;
    }
    return -1;
}

[[noreturn]] void integrity(const std::string& code,
                            const std::string& field,
                            const std::string& stage,
                            std::optional<int> step,
                            const std::string& message,
                            const std::string& why) {
    Refusal r;
    r.kind    = RefusalKind::ComputationIntegrityFailure;
    r.code    = code;
    r.field   = field;
    r.stage   = stage;
    r.step    = step;
    r.message = message;
    r.why     = why;
    throw RefusalError(std::move(r));
}

double tolerance(double scale, const ScienceConfig& config) {
    return std::max(config.conservation_abs_tol(), config.conservation_rel_tol() * std::fabs(scale));
}

void check_step(const std::string& stage, int step, const StepValues& s, const ScienceConfig& config) {
    const double* v = s.v;

    // First law: in + aux + ambient == out + loss
    const double e_in  = v[EnergyIn] + v[AuxWork] + v[AmbientHeat];
    const double e_out = v[EnergyOut] + v[EnergyLoss];
    if (std::fabs(e_in - e_out) > tolerance(std::max(e_in, e_out), config)) {
        std::ostringstream oss;
        oss << "Stage '" << stage << "' does not conserve energy at step " << step
            << ": in " << e_in << " vs out+loss " << e_out << '.';
        integrity("INTEGRITY_FIRST_LAW_VIOLATED", Variables::kEnergyOut, stage, step, oss.str(),
                  "A loss model must account for every unit of energy it receives.");
    }

    // Second law: destruction >= 0 up to rounding
    const double ex_in = v[ExergyIn] + v[AuxWork];
    const double destruction = ex_in - v[ExergyOut];
    const double allowed = std::max(config.conservation_abs_tol(),
                                    config.negative_destruction_rel_tol() * std::fabs(ex_in));
    if (destruction < -allowed) {
        std::ostringstream oss;
        oss << "Stage '" << stage << "' destroys negative exergy at step " << step
            << " (" << destruction << "): output exergy " << v[ExergyOut]
            << " exceeds input exergy " << ex_in << '.';
        integrity("INTEGRITY_NEGATIVE_DESTRUCTION", Variables::kExergyOut, stage, step, oss.str(),
                  "Exergy destruction is never negative; the loss model creates exergy.");
    }

    if (v[ExergyLoss] > v[ExergyIn] + v[AuxWork] + allowed) {
        std::ostringstream oss;
        oss << "Stage '" << stage << "' loses more exergy (" << v[ExergyLoss]
            << ") than it receives (" << ex_in << ") at step " << step << '.';
        integrity("INTEGRITY_LOSS_EXCEEDS_INPUT", Variables::kExergyLoss, stage, step, oss.str(),
                  "A loss stream cannot carry more exergy than entered the stage.");
    }
}

void check_link(const std::string& upstream, const StepValues& up,
                const std::string& downstream, const StepValues& down,
                int step, const ScienceConfig& config) {
    const std::pair<int, int> links[] = {{EnergyOut, EnergyIn}, {ExergyOut, ExergyIn}};
    for (const auto& l : links) {
        const double a = up.v[l.first];
        const double b = down.v[l.second];
        if (std::fabs(a - b) <= tolerance(std::max(std::fabs(a), std::fabs(b)), config)) continue;

        std::ostringstream oss;
        oss << "Stage '" << downstream << "' receives " << kSlots[l.second] << " = " << b
            << " at step " << step << " but upstream stage '" << upstream << "' produced "
            << kSlots[l.first] << " = " << a << '.';
        integrity("INTEGRITY_CHAIN_LINK_BROKEN", kSlots[l.second], downstream, step, oss.str(),
                  "Each stage is fed exactly what its upstream stage produced in the same step.");
    }
}

} // anonymous namespace

ExergyResult SystemBalance::result() const {
    ExergyResult r;
    r.exergy_value = delivered_exergy;
    r.efficiency   = efficiency;
    r.destruction  = total_destruction;
    r.unit         = unit;
    return r;
}

namespace Aggregator {

SystemBalance aggregate(const TimeSeries& series, const ScienceConfig& config) {
    if (series.empty()) {
        Refusal r;
        r.kind    = RefusalKind::MissingInput;
        r.code    = "REFUSE_INPUT_MISSING";
        r.field   = "time_series";
        r.message = "Cannot aggregate because the time series is empty.";
        r.why     = "Balances are only defined for a completed run.";
        throw RefusalError(std::move(r));
    }

    const std::string& unit = config.energy_unit();

    // Stage order is the order of first appearance, i.e. chain order.
    std::vector<std::string> order;
    std::map<std::string, std::size_t> index;
    std::map<std::pair<int, std::size_t>, StepValues> cells;
    std::set<int> steps;

    for (const auto& rec : series) {
        auto it = index.find(rec.stage);
        if (it == index.end()) {
            it = index.emplace(rec.stage, order.size()).first;
            order.push_back(rec.stage);
        }

        const int slot = slot_of(rec.variable);
        if (slot < 0) continue;

        if (rec.unit != unit) {
            integrity("INTEGRITY_RECORD_UNIT", rec.variable, rec.stage, rec.step,
                      "Record " + rec.variable + " of stage '" + rec.stage + "' is in '" +
                          rec.unit + "' instead of '" + unit + "'.",
                      "All accounting records of a run share one energy unit.");
        }
        if (!std::isfinite(rec.value)) {
            integrity("INTEGRITY_RECORD_NOT_FINITE", rec.variable, rec.stage, rec.step,
                      "Record " + rec.variable + " of stage '" + rec.stage + "' is not finite.",
                      "A completed run only carries finite values.");
        }

        StepValues& cell = cells[{rec.step, it->second}];
        const unsigned bit = 1u << slot;
        if (cell.seen & bit) {
            integrity("INTEGRITY_RECORD_DUPLICATE", rec.variable, rec.stage, rec.step,
                      "Record " + rec.variable + " of stage '" + rec.stage +
                          "' appears twice in one step.",
                      "Each quantity is recorded once per stage per step.");
        }
        cell.seen |= bit;
        cell.v[slot] = rec.value;
        cell.time = rec.time;
        steps.insert(rec.step);
    }

    SystemBalance b;
    b.unit  = unit;
    b.steps = static_cast<int>(steps.size());
    b.stages.resize(order.size());
    for (std::size_t i = 0; i < order.size(); ++i) b.stages[i].stage = order[i];

    const unsigned all = (1u << kSlotCount) - 1u;

    for (int step : steps) {
        for (std::size_t i = 0; i < order.size(); ++i) {
            auto it = cells.find({step, i});
            if (it == cells.end() || it->second.seen != all) {
                integrity("INTEGRITY_RECORD_MISSING", "time_series", order[i], step,
                          "Stage '" + order[i] + "' is missing accounting records at step " +
                              std::to_string(step) + ".",
                          "Every stage reports its full balance on every step.");
            }
            const StepValues& s = it->second;
            check_step(order[i], step, s, config);

            if (i > 0) {
                check_link(order[i - 1], cells.at({step, i - 1}), order[i], s, step, config);
            }

            StageBalance& sb = b.stages[i];
            sb.energy_in    += s.v[EnergyIn];
            sb.exergy_in    += s.v[ExergyIn];
            sb.aux_work     += s.v[AuxWork];
            sb.ambient_heat += s.v[AmbientHeat];
            sb.energy_out   += s.v[EnergyOut];
            sb.exergy_out   += s.v[ExergyOut];
            sb.energy_loss  += s.v[EnergyLoss];
            sb.exergy_loss  += s.v[ExergyLoss];
        }
    }

    double aux_total = 0.0;
    for (auto& sb : b.stages) {
        sb.destruction          = sb.exergy_in + sb.aux_work - sb.exergy_out;
        sb.internal_destruction = sb.destruction - sb.exergy_loss;
        aux_total           += sb.aux_work;
        b.total_destruction += sb.destruction;
        b.total_loss_exergy += sb.exergy_loss;
    }

    b.system_input_exergy = b.stages.front().exergy_in + aux_total;
    b.delivered_exergy    = b.stages.back().exergy_out;
    b.delivered_heat      = b.stages.back().energy_out;
    b.residual = b.system_input_exergy - (b.delivered_exergy + b.total_destruction);

    double scale = std::fabs(b.system_input_exergy);
    double magnitude = std::fabs(b.delivered_exergy);
    for (const auto& sb : b.stages) magnitude += std::fabs(sb.destruction);
    scale = std::max(scale, magnitude);

    if (std::fabs(b.residual) > tolerance(scale, config)) {
        std::ostringstream oss;
        oss << "System exergy balance does not close: input " << b.system_input_exergy
            << " vs delivered " << b.delivered_exergy << " + destruction "
            << b.total_destruction << " (residual " << b.residual << ' ' << unit << ").";
        integrity("INTEGRITY_CONSERVATION_VIOLATED", "system_input_exergy", "", std::nullopt,
                  oss.str(),
                  "Delivered exergy plus per-stage destruction must equal the system input.");
    }

    const ValueSpec ex_in  = derived_value(b.system_input_exergy, unit, "Ex_system_in", "aggregate");
    const ValueSpec ex_out = derived_value(b.delivered_exergy, unit, "Ex_delivered", "aggregate");
    b.efficiency = ExergyCore::exergy_efficiency(ex_out, ex_in).value();
    b.efficiency_in_range = ExergyCore::efficiency_in_range(b.efficiency);
    if (!b.efficiency_in_range) {
        std::ostringstream oss;
        oss << "System exergy efficiency " << b.efficiency << " of chain ending at '"
            << b.stages.back().stage << "' lies outside [" << ExergyCore::kEfficiencyMin
            << ", " << ExergyCore::kEfficiencyMax << "].";
        Logger::instance().message(Logger::Level::Warn, oss.str());
    }

    if (b.delivered_heat > 0.0) {
        b.input_exergy_per_functional_unit =
            b.system_input_exergy * config.functional_unit_heat() / b.delivered_heat;
    }
    return b;
}

} // namespace Aggregator
} // namespace ExergySim
