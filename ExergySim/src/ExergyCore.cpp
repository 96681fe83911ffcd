#include "ExergyCore.hpp"
#include "Guardrails.hpp"
#include "Refusal.hpp"

#include <cmath>
#include <sstream>

namespace ExergySim {
namespace ExergyCore {

namespace {

const char* const kKelvin = "K";

void require_absolute_temperature(const ValueSpec& T, const std::string& field) {
    Guardrails::require_provenance(T);
    Guardrails::require_unit(T, kKelvin, field);
    Guardrails::require_positive(T, field);
}

} // anonymous namespace

ValueSpec exergy_of_heat(const ValueSpec& Q, const ValueSpec& T0, const ValueSpec& Tb) {
    require_absolute_temperature(T0, "T0");
    require_absolute_temperature(Tb, "Tb");
    Guardrails::require_boundary_validity(T0, Tb);

    Guardrails::require_provenance(Q);
    Guardrails::require_unambiguous_energy(Q, "Q");
    Guardrails::require_non_negative(Q, "Q");

    const double ex = Q.value() * (1.0 - T0.value() / Tb.value());

    return derived_value(ex, Q.unit(), "Ex(" + Q.label() + ")", "exergy_of_heat");
}

ValueSpec exergy_efficiency(const ValueSpec& ex_out, const ValueSpec& ex_in) {
    Guardrails::require_provenance(ex_out);
    Guardrails::require_provenance(ex_in);
    Guardrails::require_unit(ex_out, ex_in.unit(), "Ex_out");
    Guardrails::require_positive_input_exergy(ex_in);

    const double eta = ex_out.value() / ex_in.value();

    return derived_value(eta, "-", "eta_ex(" + ex_out.label() + "/" + ex_in.label() + ")",
                         "exergy_efficiency");
}

bool efficiency_in_range(double eta) {
    return eta >= kEfficiencyMin && eta <= kEfficiencyMax;
}

ValueSpec boundary_temperature_from_glide(const ValueSpec& Ts,
                                          const ValueSpec& Tr,
                                          GlidePolicy policy) {
    require_absolute_temperature(Ts, "Ts");
    require_absolute_temperature(Tr, "Tr");

    if (Ts.value() < Tr.value()) {
        std::ostringstream oss;
        oss << "Cannot derive Tb because supply temperature Ts (" << Ts.value()
            << " K) is below return temperature Tr (" << Tr.value() << " K).";
        Refusal r;
        r.kind    = RefusalKind::InvalidTemperatureBoundary;
        r.code    = "REFUSE_GLIDE_INVERTED";
        r.field   = "Ts";
        r.message = oss.str();
        r.why     = "Heat delivered to a DH network cools from supply to return, never the reverse.";
        throw RefusalError(std::move(r));
    }

    const std::string tool = std::string("boundary_temperature_from_glide:") + to_string(policy);

    if (Ts.value() == Tr.value()) {
        return derived_value(Ts.value(), kKelvin, "Tb", tool);
    }

    double tb = 0.0;
    switch (policy) {
        case GlidePolicy::LogMean:
            tb = (Ts.value() - Tr.value()) / std::log(Ts.value() / Tr.value());
            break;
        case GlidePolicy::Arithmetic:
            tb = 0.5 * (Ts.value() + Tr.value());
            break;
    }
    return derived_value(tb, kKelvin, "Tb", tool);
}

} // namespace ExergyCore
} // namespace ExergySim
