#include "test_support.hpp"

#include <vector>

#include "Aggregator.hpp"
#include "Logger.hpp"

using namespace ExergySim;
using namespace TestSupport;

namespace {

struct Flows {
    double energy_in, exergy_in, aux, ambient, energy_out, exergy_out, energy_loss, exergy_loss;
};

void push_stage(TimeSeries& ts, int step, const std::string& stage, const Flows& f,
                const std::string& unit = "MWh") {
    const double t = static_cast<double>(step);
    const std::pair<const char*, double> vars[] = {
        {Variables::kEnergyIn, f.energy_in},     {Variables::kExergyIn, f.exergy_in},
        {Variables::kAuxWorkIn, f.aux},          {Variables::kAmbientHeat, f.ambient},
        {Variables::kEnergyOut, f.energy_out},   {Variables::kExergyOut, f.exergy_out},
        {Variables::kEnergyLoss, f.energy_loss}, {Variables::kExergyLoss, f.exergy_loss},
    };
    for (const auto& v : vars) {
        ts.push_back(TimeSeriesRecord{t, step, stage, v.first, v.second, unit, SourceType::Derived});
    }
}

// Two stages, two identical steps:
//   source: 10 in (exergy 10), 9 out (exergy 2), 1 lost without exergy
//   sink:   9 in (exergy 2) + 1 work, 9.5 out (exergy 1.5), 0.5 lost (exergy 0.1)
TimeSeries two_stage_series() {
    TimeSeries ts;
    for (int k = 0; k < 2; ++k) {
        push_stage(ts, k, "source", {10.0, 10.0, 0.0, 0.0, 9.0, 2.0, 1.0, 0.0});
        push_stage(ts, k, "sink",   {9.0, 2.0, 1.0, 0.0, 9.5, 1.5, 0.5, 0.1});
    }
    return ts;
}

Refusal expect_integrity(const TimeSeries& ts, const std::string& code) {
    const ScienceConfig config;
    Refusal r = expect_refusal([&] { Aggregator::aggregate(ts, config); },
                               RefusalKind::ComputationIntegrityFailure);
    if (r.code != code) std::cerr << "[FAIL] expected " << code << ", got " << r.code << "\n";
    assert(r.code == code);
    assert(r.is_integrity_failure());
    return r;
}

} // namespace

// ✅ Test 1: balances of a consistent series
void test_balance_of_consistent_series() {
    const ScienceConfig config;
    const SystemBalance b = Aggregator::aggregate(two_stage_series(), config);

    assert(b.steps == 2);
    assert(b.unit == "MWh");
    assert(b.stages.size() == 2);
    assert(b.stages[0].stage == "source");
    assert(b.stages[1].stage == "sink");

    assert(near(b.stages[0].destruction, 16.0));
    assert(near(b.stages[0].internal_destruction, 16.0));
    assert(near(b.stages[1].destruction, 3.0));
    assert(near(b.stages[1].internal_destruction, 2.8));
    assert(near(b.stages[1].aux_work, 2.0));

    assert(near(b.system_input_exergy, 22.0));
    assert(near(b.delivered_exergy, 3.0));
    assert(near(b.delivered_heat, 19.0));
    assert(near(b.total_destruction, 19.0));
    assert(near(b.total_loss_exergy, 0.2));
    assert(near(b.residual, 0.0));
    assert(near(b.efficiency, 3.0 / 22.0));
    assert(b.input_exergy_per_functional_unit);
    assert(near(*b.input_exergy_per_functional_unit, 22.0 / 19.0));

    const ExergyResult r = b.result();
    assert(r.exergy_value == b.delivered_exergy);
    assert(r.destruction == b.total_destruction);
    assert(r.efficiency == b.efficiency);
    assert(r.unit == "MWh");
    std::cout << "[PASS] Stage and system balances of a consistent series.\n";
}

// ✅ Test 2: declared outputs ride along without entering the balance
void test_declared_outputs_ignored() {
    const ScienceConfig config;
    TimeSeries ts = two_stage_series();
    ts.insert(ts.begin() + 8, TimeSeriesRecord{0.0, 0, "source", "tank_volume", 500.0, "m3",
                                               SourceType::Assumed});
    const SystemBalance b = Aggregator::aggregate(ts, config);
    assert(near(b.system_input_exergy, 22.0));
    std::cout << "[PASS] Declared outputs do not disturb the balance.\n";
}

// ✅ Test 3: a stage that creates energy is an integrity failure
void test_first_law_violation() {
    TimeSeries ts = two_stage_series();
    ts[4].value = 9.5;   // source energy_out on step 0
    Refusal r = expect_integrity(ts, "INTEGRITY_FIRST_LAW_VIOLATED");
    assert(r.stage == "source");
    assert(r.step && *r.step == 0);
    std::cout << "[PASS] First-law violation flagged as integrity failure.\n";
}

// ✅ Test 4: negative destruction is an integrity failure
void test_negative_destruction() {
    TimeSeries ts;
    push_stage(ts, 0, "source", {1.0, 0.2, 0.0, 0.0, 1.0, 0.3, 0.0, 0.0});
    Refusal r = expect_integrity(ts, "INTEGRITY_NEGATIVE_DESTRUCTION");
    assert(r.stage == "source");

    // Rounding-sized negatives pass
    TimeSeries ok;
    push_stage(ok, 0, "source", {1.0, 0.2, 0.0, 0.0, 1.0, 0.2 + 1e-13, 0.0, 0.0});
    const ScienceConfig config;
    const SystemBalance b = Aggregator::aggregate(ok, config);
    assert(b.stages[0].destruction < 0.0);
    std::cout << "[PASS] Negative destruction flagged beyond tolerance.\n";
}

// ✅ Test 5: downstream stage not fed what upstream produced
void test_broken_chain_link() {
    TimeSeries ts;
    push_stage(ts, 0, "source", {10.0, 10.0, 0.0, 0.0, 9.0, 2.0, 1.0, 0.0});
    push_stage(ts, 0, "sink",   {9.0, 2.5, 0.0, 0.0, 9.0, 1.5, 0.0, 0.0});
    Refusal r = expect_integrity(ts, "INTEGRITY_CHAIN_LINK_BROKEN");
    assert(r.stage == "sink");
    assert(r.field == Variables::kExergyIn);
    std::cout << "[PASS] Broken chain link flagged.\n";
}

// ✅ Test 6: incomplete, duplicated or mis-united records
void test_record_integrity() {
    TimeSeries missing = two_stage_series();
    missing.erase(missing.begin() + 10);   // sink aux_work_in, step 0
    Refusal r = expect_integrity(missing, "INTEGRITY_RECORD_MISSING");
    assert(r.stage == "sink");

    TimeSeries dropped_stage = two_stage_series();
    dropped_stage.erase(dropped_stage.begin() + 24, dropped_stage.end());   // sink, step 1
    r = expect_integrity(dropped_stage, "INTEGRITY_RECORD_MISSING");
    assert(r.step && *r.step == 1);

    TimeSeries wrong_unit = two_stage_series();
    wrong_unit[13].unit = "kWh";
    expect_integrity(wrong_unit, "INTEGRITY_RECORD_UNIT");

    TimeSeries duplicated = two_stage_series();
    duplicated.push_back(duplicated[0]);
    expect_integrity(duplicated, "INTEGRITY_RECORD_DUPLICATE");
    std::cout << "[PASS] Missing, duplicated and mis-united records flagged.\n";
}

// ✅ Test 7: refusals that are not integrity failures
void test_non_integrity_refusals() {
    const ScienceConfig config;
    Refusal r = expect_refusal([&] { Aggregator::aggregate(TimeSeries{}, config); },
                               RefusalKind::MissingInput);
    assert(r.field == "time_series");

    TimeSeries idle;
    push_stage(idle, 0, "source", {0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0});
    expect_refusal([&] { Aggregator::aggregate(idle, config); }, RefusalKind::ZeroInputExergy);
    std::cout << "[PASS] Empty series and zero input exergy refused.\n";
}

// ✅ Test 8: link drift below the per-step tolerance still breaks the system balance
void test_accumulated_link_drift() {
    // Six pass-through stages; each hands on 0.9e-7 less exergy than it
    // produced, inside the 1e-7 link tolerance at this scale. The five links
    // add up to a residual of 4.5e-7.
    const double drift = 0.9e-7;
    TimeSeries ts;
    double exergy = 100.0;
    for (int i = 0; i < 6; ++i) {
        push_stage(ts, 0, "stage" + std::to_string(i),
                   {100.0, exergy, 0.0, 0.0, 100.0, exergy, 0.0, 0.0});
        exergy -= drift;
    }
    Refusal r = expect_integrity(ts, "INTEGRITY_CONSERVATION_VIOLATED");
    assert(r.stage.empty());
    assert(!r.step);
    assert(r.field == "system_input_exergy");

    // A single drifted link stays inside the system tolerance as well.
    TimeSeries one;
    push_stage(one, 0, "stage0", {100.0, 100.0, 0.0, 0.0, 100.0, 100.0, 0.0, 0.0});
    push_stage(one, 0, "stage1", {100.0, 100.0 - drift, 0.0, 0.0, 100.0, 100.0 - drift, 0.0, 0.0});
    const ScienceConfig config;
    const SystemBalance b = Aggregator::aggregate(one, config);
    assert(near(b.residual, drift, 1e-12));
    std::cout << "[PASS] Accumulated link drift breaks system conservation.\n";
}

// ✅ Test 9: implausible efficiency is flagged, not refused
void test_efficiency_out_of_range() {
    const ScienceConfig config;
    assert(Aggregator::aggregate(two_stage_series(), config).efficiency_in_range);

    // Heat handed over below T0 carries negative exergy.
    TimeSeries cold;
    push_stage(cold, 0, "source", {1.0, 1.0, 0.0, 0.0, 1.0, -0.1, 0.0, 0.0});
    const SystemBalance b = Aggregator::aggregate(cold, config);
    assert(near(b.efficiency, -0.1));
    assert(!b.efficiency_in_range);

    assert(ExergyCore::efficiency_in_range(0.0));
    assert(ExergyCore::efficiency_in_range(1.2));
    assert(!ExergyCore::efficiency_in_range(1.21));
    std::cout << "[PASS] Efficiency outside [0, 1.2] flagged on the balance.\n";
}

int main() {
    Logger::instance().set_enabled(false);

    test_balance_of_consistent_series();
    test_declared_outputs_ignored();
    test_first_law_violation();
    test_negative_destruction();
    test_broken_chain_link();
    test_record_integrity();
    test_non_integrity_refusals();
    test_accumulated_link_drift();
    test_efficiency_out_of_range();

    std::cout << "\n✅ All aggregator tests passed!\n";
    return 0;
}
