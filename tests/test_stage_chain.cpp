#include "test_support.hpp"

#include "Guardrails.hpp"

using namespace ExergySim;
using namespace TestSupport;

// ✅ Test 1: a scenario without T0 refuses naming T0
void test_scenario_missing_t0() {
    const ScienceConfig config;
    Refusal r = expect_refusal([&] {
        ScenarioBuilder("no_t0")
            .boundary_temperature(kelvin(350.0, "Tb"))
            .delivery_boundary(config.dh_boundary_name())
            .build(config);
    }, RefusalKind::MissingInput);
    assert(r.field == "T0");
    assert(r.code == "REFUSE_INPUT_MISSING");
    std::cout << "[PASS] Missing T0 refused with MissingInput(T0).\n";
}

// ✅ Test 2: scenario temperature and boundary rules
void test_scenario_validation() {
    const ScienceConfig config;

    Refusal r = expect_refusal([&] {
        reference_scenario_builder(config, 300.0, 300.0).build(config);
    }, RefusalKind::InvalidTemperatureBoundary);
    assert(r.field == "Tb");

    r = expect_refusal([&] {
        reference_scenario_builder(config)
            .supply_return(kelvin(358.15, "Ts"), kelvin(318.15, "Tr"))
            .build(config);
    }, RefusalKind::InvalidTemperatureBoundary);
    assert(r.code == "REFUSE_TB_OVERSPECIFIED");

    r = expect_refusal([&] {
        reference_scenario_builder(config).delivery_boundary("building_meter").build(config);
    }, RefusalKind::MissingBoundaryElement);
    assert(r.code == "REFUSE_DELIVERY_BOUNDARY_MISMATCH");

    r = expect_refusal([&] {
        reference_scenario_builder(config).require_for_delivery("network_pump").build(config);
    }, RefusalKind::MissingBoundaryElement);
    assert(r.code == "REFUSE_BOUNDARY_ELEMENT_MISSING");

    expect_refusal([&] {
        reference_scenario_builder(config)
            .reference_temperature(assumed_value(7.0, "degC", "T0", "weather"))
            .build(config);
    }, RefusalKind::UnitMismatch);

    expect_refusal([&] {
        reference_scenario_builder(config)
            .auxiliary_input("grid_factor", assumed_value(1.0, "-", "grid factor", ""))
            .build(config);
    }, RefusalKind::MissingProvenance);
    std::cout << "[PASS] Scenario refuses bad boundaries, units and provenance.\n";
}

// ✅ Test 3: glide scenarios derive Tb; revise() yields an independent scenario
void test_scenario_glide_and_revise() {
    const ScienceConfig config;
    ScenarioBuilder b("glide");
    b.reference_temperature(kelvin(280.0, "T0"))
     .supply_return(kelvin(358.15, "Ts"), kelvin(318.15, "Tr"))
     .delivery_boundary(config.dh_boundary_name())
     .boundary_element(kSubstation, true);
    const Scenario s = b.build(config);

    assert(near(s.Tb().value(), 40.0 / std::log(358.15 / 318.15), 1e-9));
    assert(s.Tb().source_type() == SourceType::Derived);
    assert(s.supply_temperature() && s.supply_temperature()->value() == 358.15);
    assert(s.required_for_delivery().count(kSubstation) == 1);

    const Scenario colder = s.revise().reference_temperature(kelvin(268.15, "T0")).build(config);
    assert(colder.T0().value() == 268.15);
    assert(s.T0().value() == 280.0);
    assert(colder.Tb() == s.Tb());
    assert(colder.boundary_elements() == s.boundary_elements());

    // Inverted glide
    Refusal r = expect_refusal([&] {
        s.revise().supply_return(kelvin(318.15, "Ts"), kelvin(358.15, "Tr")).build(config);
    }, RefusalKind::InvalidTemperatureBoundary);
    assert(r.code == "REFUSE_GLIDE_INVERTED");
    std::cout << "[PASS] Glide scenario derives Tb; revision leaves the original intact.\n";
}

// ✅ Test 4: [CHARGE, STORE, CONVERT] is not a chain
void test_chain_without_delivery() {
    const ScienceConfig config;
    const Scenario scenario = reference_scenario(config);

    StageChainBuilder b("no_delivery");
    b.append(boiler_stage())
     .append(tank_stage())
     .append(Stage(StageKind::Convert, "convert_booster", LossModels::heat_output(),
                   {{LossModels::kHeatYield, ratio(1.0, "yield")},
                    {LossModels::kOutputTemperature, kelvin(353.15, "booster outlet")}}));

    Refusal r = expect_refusal([&] { b.finalize(scenario); }, RefusalKind::IncompleteChain);
    assert(r.code == "REFUSE_STAGECHAIN_NO_DELIVER");

    r = expect_refusal([&] { StageChainBuilder("empty").finalize(scenario); },
                       RefusalKind::IncompleteChain);
    assert(r.code == "REFUSE_STAGECHAIN_EMPTY");
    std::cout << "[PASS] Chain not ending in DELIVER refused with IncompleteChain.\n";
}

// ✅ Test 5: structural chain rules
void test_chain_structure_rules() {
    const ScienceConfig config;
    const Scenario scenario = reference_scenario(config);

    // Duplicate stage names
    StageChainBuilder dup("dup");
    dup.append(boiler_stage()).append(tank_stage()).append(tank_stage()).append(substation_stage());
    Refusal r = expect_refusal([&] { dup.finalize(scenario); }, RefusalKind::InvalidValue);
    assert(r.code == "REFUSE_STAGE_NAME_DUPLICATE");

    // energy_in is only drawn by the first stage
    StageChainBuilder twice("twice");
    twice.append(boiler_stage())
         .append(Stage(StageKind::Store, "store_tank", LossModels::standing_loss(),
                       {{StageInputNames::kEnergyIn, electricity(1.0, "second source")}}))
         .append(substation_stage());
    r = expect_refusal([&] { twice.finalize(scenario); }, RefusalKind::InvalidValue);
    assert(r.code == "REFUSE_ENERGY_IN_NOT_FIRST");
    assert(r.stage == "store_tank");

    // Delivery component outside the scenario boundary
    const Scenario narrow = ScenarioBuilder("narrow")
        .reference_temperature(kelvin(280.0, "T0"))
        .boundary_temperature(kelvin(350.0, "Tb"))
        .delivery_boundary(config.dh_boundary_name())
        .boundary_element("dh_network_interface")
        .build(config);
    r = expect_refusal([&] { boiler_tank_chain().finalize(narrow); },
                       RefusalKind::MissingBoundaryElement);
    assert(r.stage == "deliver_substation");
    assert(r.field == "boundary_elements.dh_substation");

    // Stage construction
    r = expect_refusal([] { Stage(StageKind::Store, "tank", LossModel{}); },
                       RefusalKind::MissingInput);
    assert(r.code == "REFUSE_LOSS_MODEL_MISSING");

    expect_refusal([] {
        Stage(StageKind::Store, "tank", LossModels::standing_loss(),
              {{LossModels::kHoldDuration, assumed_value(2.0, "h", "hold", "")}});
    }, RefusalKind::MissingProvenance);

    expect_refusal([] { Stage(StageKind::Store, "", LossModels::standing_loss()); },
                   RefusalKind::MissingInput);
    std::cout << "[PASS] Duplicate names, stray sources and boundary gaps refused.\n";
}

// ✅ Test 6: revision produces a new chain, the original is untouched
void test_chain_revision() {
    const ScienceConfig config;
    const Scenario scenario = reference_scenario(config);

    const StageChain original = boiler_tank_chain().finalize(scenario);
    assert(original.size() == 3);
    assert(original.delivery_stage().kind() == StageKind::Deliver);
    assert(original.stages().front().kind() == StageKind::Charge);

    const StageChain revised = original.revise().replace(tank_stage(0.01, 24.0)).finalize(scenario);
    assert(revised.size() == 3);
    assert(revised.stages()[1].find_input(LossModels::kHoldDuration)->value() == 24.0);
    assert(original.stages()[1].find_input(LossModels::kHoldDuration)->value() == 2.0);

    Refusal r = expect_refusal([&] {
        original.revise().replace(Stage(StageKind::Store, "store_cavern",
                                        LossModels::standing_loss()));
    }, RefusalKind::MissingInput);
    assert(r.code == "REFUSE_STAGE_NOT_FOUND");
    std::cout << "[PASS] Chain revision yields a second chain.\n";
}

// ✅ Test 7: stage evaluation in isolation
void test_stage_evaluate() {
    const ScienceConfig config;
    const Scenario scenario = reference_scenario(config);
    const TickContext tick{0, 0.0, 1.0};

    // First stage draws from its own source: 1 MWh electricity, factor 1
    const StageResult charge = boiler_stage().evaluate(scenario, config, tick, std::nullopt);
    assert(near(charge.inflow.energy, 1.0));
    assert(near(charge.inflow.exergy, 1.0));
    assert(near(charge.output.energy, 0.99));
    assert(near(charge.output.exergy, 0.99 * (1.0 - 280.0 / 363.15)));
    assert(near(charge.loss.energy, 0.01));
    assert(charge.loss.exergy == 0.0);

    // Standing loss keeps the carrier quality
    const StageResult store = tank_stage().evaluate(scenario, config, tick, charge.output);
    const double quality = charge.output.exergy / charge.output.energy;
    assert(near(store.output.energy, 0.99 * 0.99 * 0.99));
    assert(near(store.output.exergy / store.output.energy, quality));
    assert(near(store.loss.exergy, quality * store.loss.energy));

    // Heat source stated by temperature rather than exergy factor
    const Stage solar(StageKind::Charge, "charge_solar", LossModels::heat_output(),
                      {{StageInputNames::kEnergyIn,
                        with_energy_kind(measured_value(2.0, "MWh", "collector heat", "meter"),
                                         EnergyKind::Thermal)},
                       {StageInputNames::kSourceTemperature, kelvin(373.15, "collector outlet")},
                       {LossModels::kHeatYield, ratio(0.98, "piping")},
                       {LossModels::kOutputTemperature, kelvin(363.15, "tank")}});
    const StageResult sr = solar.evaluate(scenario, config, tick, std::nullopt);
    assert(near(sr.inflow.exergy, 2.0 * (1.0 - 280.0 / 373.15)));

    // Missing parameter names the stage's input
    const Stage bare(StageKind::Store, "store_bare", LossModels::standing_loss(),
                     {{LossModels::kLossFractionPerTime,
                       assumed_value(0.01, "1/h", "loss", "test fixture")}});
    Refusal r = expect_refusal([&] { bare.evaluate(scenario, config, tick, charge.output); },
                               RefusalKind::MissingInput);
    assert(r.field == "stage.inputs.hold_duration");

    // Source energy without a declared kind
    const Stage vague(StageKind::Charge, "charge_vague", LossModels::work_output(),
                      {{StageInputNames::kEnergyIn, measured_value(1.0, "MWh", "E", "meter")},
                       {LossModels::kEfficiency, ratio(0.9, "eta")}});
    expect_refusal([&] { vague.evaluate(scenario, config, tick, std::nullopt); },
                   RefusalKind::AmbiguousUnit);
    std::cout << "[PASS] Stages evaluate their own loss models.\n";
}

int main() {
    test_scenario_missing_t0();
    test_scenario_validation();
    test_scenario_glide_and_revise();
    test_chain_without_delivery();
    test_chain_structure_rules();
    test_chain_revision();
    test_stage_evaluate();

    std::cout << "\n✅ All stage chain tests passed!\n";
    return 0;
}
