#include "LossModels.hpp"
#include "Guardrails.hpp"
#include "Refusal.hpp"
#include "Scenario.hpp"

#include <cmath>
#include <sstream>

namespace ExergySim {
namespace LossModels {

namespace {

const ValueSpec& dimensionless(const StageInputs& in, const char* name) {
    const ValueSpec& v = in.require(name);
    Guardrails::require_unit(v, "-", name);
    return v;
}

double fraction(const StageInputs& in, const char* name) {
    const ValueSpec& v = dimensionless(in, name);
    Guardrails::require_fraction(v, name);
    return v.value();
}

} // anonymous namespace

LossModel work_output() {
    return [](const StageInputs& in) {
        const double eta = fraction(in, kEfficiency);

        StageFlows f;
        f.output.energy = eta * in.supplied_energy();
        f.output.exergy = f.output.energy;
        f.loss.energy   = in.supplied_energy() - f.output.energy;
        return f;
    };
}

LossModel heat_output(const std::string& temperature_input) {
    return [temperature_input](const StageInputs& in) {
        const ValueSpec& yield = dimensionless(in, kHeatYield);
        Guardrails::require_positive(yield, kHeatYield);
        const ValueSpec& T = in.require(temperature_input);

        const double supplied = in.supplied_energy();

        StageFlows f;
        f.output.energy = yield.value() * supplied;
        if (f.output.energy >= supplied) {
            f.ambient_heat = f.output.energy - supplied;
        } else {
            f.loss.energy = supplied - f.output.energy;
        }
        f.output.exergy = in.heat_exergy(f.output.energy, T);

        const double limit = in.supplied_exergy() * (1.0 + in.config().negative_destruction_rel_tol());
        if (f.output.exergy > limit) {
            std::ostringstream oss;
            oss << "Stage '" << in.stage().name() << "' heat_yield " << yield.value()
                << " gives " << f.output.exergy << ' ' << in.config().energy_unit()
                << " of exergy at " << T.value() << " K from only " << in.supplied_exergy()
                << " supplied; the yield is above the Carnot limit.";
            Refusal r;
            r.kind    = RefusalKind::InvalidValue;
            r.code    = "REFUSE_HEAT_YIELD_ABOVE_CARNOT";
            r.field   = kHeatYield;
            r.stage   = in.stage().name();
            r.message = oss.str();
            r.why     = "No heat pump delivers more exergy than the work and heat it takes in.";
            throw RefusalError(std::move(r));
        }
        return f;
    };
}

LossModel chemical_output() {
    return [](const StageInputs& in) {
        const double eta    = fraction(in, kEfficiency);
        const double factor = fraction(in, kOutputExergyFactor);

        StageFlows f;
        f.output.energy = eta * in.supplied_energy();
        f.output.exergy = factor * f.output.energy;
        f.loss.energy   = in.supplied_energy() - f.output.energy;
        return f;
    };
}

LossModel standing_loss() {
    return [](const StageInputs& in) {
        const std::string& tu = in.config().time_unit();

        const ValueSpec& rate = in.require(kLossFractionPerTime);
        Guardrails::require_unit(rate, "1/" + tu, kLossFractionPerTime);
        Guardrails::require_fraction(rate, kLossFractionPerTime);

        const ValueSpec& hold = in.require(kHoldDuration);
        Guardrails::require_unit(hold, tu, kHoldDuration);
        Guardrails::require_non_negative(hold, kHoldDuration);

        const double retained = std::pow(1.0 - rate.value(), hold.value());
        const double supplied = in.supplied_energy();
        const double quality  = supplied > 0.0 ? in.supplied_exergy() / supplied : 0.0;

        StageFlows f;
        f.output.energy = retained * supplied;
        f.output.exergy = quality * f.output.energy;
        f.loss.energy   = supplied - f.output.energy;
        f.loss.exergy   = quality * f.loss.energy;
        return f;
    };
}

LossModel boundary_delivery() {
    return [](const StageInputs& in) {
        const double eta = fraction(in, kExchangerEfficiency);

        StageFlows f;
        f.output.energy = eta * in.supplied_energy();
        f.output.exergy = in.heat_exergy(f.output.energy, in.scenario().Tb());
        f.loss.energy   = in.supplied_energy() - f.output.energy;

        const double limit = in.supplied_exergy() * (1.0 + in.config().negative_destruction_rel_tol());
        if (f.output.exergy > limit) {
            std::ostringstream oss;
            oss << "Stage '" << in.stage().name() << "' would deliver " << f.output.exergy
                << ' ' << in.config().energy_unit() << " of exergy at Tb = "
                << in.scenario().Tb().value() << " K from only " << in.supplied_exergy()
                << " supplied; the heat arrives below the boundary temperature.";
            Refusal r;
            r.kind    = RefusalKind::InvalidTemperatureBoundary;
            r.code    = "REFUSE_DELIVERY_ABOVE_SUPPLY_QUALITY";
            r.field   = "Tb";
            r.stage   = in.stage().name();
            r.message = oss.str();
            r.why     = "Heat cannot be handed over at a higher temperature than it is "
                        "supplied at without an upgrading stage.";
            throw RefusalError(std::move(r));
        }
        return f;
    };
}

} // namespace LossModels
} // namespace ExergySim
