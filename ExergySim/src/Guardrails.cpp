#include "Guardrails.hpp"
#include "Scenario.hpp"
#include "Stage.hpp"

#include <cmath>
#include <set>
#include <sstream>

namespace ExergySim {
namespace Guardrails {

namespace {

[[noreturn]] void refuse(RefusalKind kind,
                         const std::string& code,
                         const std::string& field,
                         const std::string& message,
                         const std::string& why) {
    Refusal r;
    r.kind    = kind;
    r.code    = code;
    r.field   = field;
    r.message = message;
    r.why     = why;
    throw RefusalError(std::move(r));
}

bool is_wh_family(const std::string& unit) {
    return unit == "Wh" || unit == "kWh" || unit == "MWh" || unit == "GWh";
}

} // anonymous namespace

// ---------------- presence ----------------

const ValueSpec& require_present(const std::optional<ValueSpec>& v, const std::string& field) {
    if (!v) {
        refuse(RefusalKind::MissingInput, "REFUSE_INPUT_MISSING", field,
               "Cannot compute because " + field + " is missing.",
               "Every physical input must be supplied explicitly; none is defaulted.");
    }
    return *v;
}

const ValueSpec& require_present(const ValueSpec* v, const std::string& field) {
    if (v == nullptr) {
        refuse(RefusalKind::MissingInput, "REFUSE_INPUT_MISSING", field,
               "Cannot compute because " + field + " is missing.",
               "Every physical input must be supplied explicitly; none is defaulted.");
    }
    return *v;
}

void require_non_empty(const std::string& text, const std::string& field) {
    if (text.empty()) {
        refuse(RefusalKind::MissingInput, "REFUSE_INPUT_MISSING", field,
               "Cannot proceed because " + field + " is empty.",
               "Units, labels and names are part of a value's identity and are never defaulted.");
    }
}

// ---------------- value rules ----------------

void require_finite(double value, const std::string& field) {
    if (!std::isfinite(value)) {
        refuse(RefusalKind::InvalidValue, "REFUSE_VALUE_NOT_FINITE", field,
               "Cannot compute because " + field + " is not a finite number.",
               "NaN or infinite inputs cannot take part in an exergy balance.");
    }
}

void require_positive(const ValueSpec& v, const std::string& field) {
    if (!(v.value() > 0.0)) {
        std::ostringstream oss;
        oss << "Cannot compute because " << field << " must be > 0 (got "
            << v.value() << ' ' << v.unit() << ").";
        refuse(RefusalKind::InvalidValue, "REFUSE_VALUE_NOT_POSITIVE", field, oss.str(),
               "This quantity is only physically meaningful when strictly positive.");
    }
}

void require_non_negative(const ValueSpec& v, const std::string& field) {
    if (v.value() < 0.0) {
        std::ostringstream oss;
        oss << "Cannot compute because " << field << " must be >= 0 (got "
            << v.value() << ' ' << v.unit() << ").";
        refuse(RefusalKind::InvalidValue, "REFUSE_VALUE_NEGATIVE", field, oss.str(),
               "Energy quantities entering a stage cannot be negative.");
    }
}

void require_fraction(const ValueSpec& v, const std::string& field) {
    if (v.value() < 0.0 || v.value() > 1.0) {
        std::ostringstream oss;
        oss << "Cannot compute because " << field << " must lie in [0, 1] (got "
            << v.value() << ").";
        refuse(RefusalKind::InvalidValue, "REFUSE_VALUE_NOT_FRACTION", field, oss.str(),
               "Efficiencies and loss fractions are bounded by energy conservation.");
    }
}

// ---------------- unit / provenance rules ----------------

void require_unit(const ValueSpec& v, const std::string& unit, const std::string& field) {
    if (v.unit() != unit) {
        refuse(RefusalKind::UnitMismatch, "REFUSE_UNIT_MISMATCH", field,
               "Cannot compute because " + field + " is in '" + v.unit() +
                   "' but '" + unit + "' is required.",
               "Units are normalized before the core; the core never converts silently.");
    }
}

void require_unambiguous_energy(const ValueSpec& v, const std::string& field) {
    if (is_wh_family(v.unit()) && v.energy_kind() == EnergyKind::Unspecified) {
        refuse(RefusalKind::AmbiguousUnit, "REFUSE_UNIT_AMBIGUOUS", field,
               "Cannot compute because '" + v.unit() +
                   "' is ambiguous (thermal vs electric is unknown).",
               "Watt-hour quantities must declare their energy kind; efficiency chains "
               "and exergy results are wrong otherwise.");
    }
}

void require_provenance(const ValueSpec& v) {
    const Provenance& p = v.provenance();
    const std::string& label = v.label();

    switch (v.source_type()) {
        case SourceType::Measured:
            if (p.source.empty()) {
                refuse(RefusalKind::MissingProvenance, "REFUSE_PROVENANCE_MISSING",
                       label + ".provenance.source",
                       "Measured value " + label + " does not name its measurement source.",
                       "Measured values must be traceable to where they were measured.");
            }
            break;
        case SourceType::Assumed:
            if (p.note.empty()) {
                refuse(RefusalKind::MissingProvenance, "REFUSE_PROVENANCE_MISSING",
                       label + ".provenance.note",
                       "Assumed value " + label + " carries no note explaining the assumption.",
                       "Assumptions must be stated so they can be challenged.");
            }
            break;
        case SourceType::External:
            if (p.source.empty() || p.time_range.empty()) {
                refuse(RefusalKind::MissingProvenance, "REFUSE_PROVENANCE_MISSING",
                       label + (p.source.empty() ? ".provenance.source" : ".provenance.time_range"),
                       "External value " + label + " needs both a source and a time range.",
                       "External data is only comparable within its stated validity window.");
            }
            break;
        case SourceType::Derived:
            if (p.tool.empty()) {
                refuse(RefusalKind::MissingProvenance, "REFUSE_PROVENANCE_MISSING",
                       label + ".provenance.tool",
                       "Derived value " + label + " does not name the tool that computed it.",
                       "Derived values are only trustworthy when the computation is traceable.");
            }
            break;
    }

    if (p.citation && (p.citation->document.empty() || p.citation->page <= 0)) {
        refuse(RefusalKind::MissingProvenance, "REFUSE_CITATION_INCOMPLETE",
               label + ".provenance.citation",
               "Citation for " + label + " needs a document name and a page number.",
               "A citation without document and page cannot be checked.");
    }
}

// ---------------- physics / structure rules ----------------

void require_boundary_validity(const ValueSpec& T0, const ValueSpec& Tb) {
    if (Tb.value() <= T0.value()) {
        std::ostringstream oss;
        oss << "Cannot compute exergy of heat because Tb (" << Tb.value() << ' ' << Tb.unit()
            << ") is not above T0 (" << T0.value() << ' ' << T0.unit() << ").";
        refuse(RefusalKind::InvalidTemperatureBoundary, "REFUSE_TB_BELOW_OR_EQUAL_T0", "Tb",
               oss.str(),
               "The shortcut Ex = Q (1 - T0/Tb) is only defined for heat delivered above "
               "the reference environment temperature.");
    }
}

void require_chain_terminates_in_delivery(const std::vector<Stage>& stages) {
    if (stages.empty()) {
        refuse(RefusalKind::IncompleteChain, "REFUSE_STAGECHAIN_EMPTY", "stage_chain.stages",
               "Cannot build system because the stage chain has no stages.",
               "A system must contain at least one stage.");
    }
    const Stage& last = stages.back();
    if (last.kind() != StageKind::Deliver) {
        refuse(RefusalKind::IncompleteChain, "REFUSE_STAGECHAIN_NO_DELIVER",
               "stage_chain[" + std::to_string(stages.size() - 1) + "].kind",
               "Cannot build system because the stage chain ends with " +
                   std::string(to_string(last.kind())) + " stage '" + last.name() +
                   "' instead of DELIVER.",
               "The functional unit is heat delivered at the DH boundary, so every chain "
               "must end in delivery.");
    }
}

void require_unique_stage_names(const std::vector<Stage>& stages) {
    std::set<std::string> seen;
    for (const auto& s : stages) {
        if (!seen.insert(s.name()).second) {
            refuse(RefusalKind::InvalidValue, "REFUSE_STAGE_NAME_DUPLICATE", "stage.name",
                   "Cannot build system because stage name '" + s.name() + "' is used twice.",
                   "Time-series records are attributed to stages by name.");
        }
    }
}

void require_boundary_completeness(const Scenario& scenario) {
    const auto& boundary = scenario.boundary_elements();
    for (const auto& id : scenario.required_for_delivery()) {
        if (boundary.count(id) == 0) {
            refuse(RefusalKind::MissingBoundaryElement, "REFUSE_BOUNDARY_ELEMENT_MISSING",
                   "boundary_elements." + id,
                   "Cannot compute because component '" + id +
                       "' is required for heat delivery but lies outside the declared boundary.",
                   "Every system must be assessed against the same complete delivery boundary.");
        }
    }
}

void require_boundary_completeness(const Scenario& scenario, const std::vector<Stage>& stages) {
    require_boundary_completeness(scenario);

    const auto& boundary = scenario.boundary_elements();
    for (const auto& s : stages) {
        if (!s.required_for_delivery()) continue;
        if (boundary.count(s.component_id()) == 0) {
            Refusal r;
            r.kind    = RefusalKind::MissingBoundaryElement;
            r.code    = "REFUSE_BOUNDARY_ELEMENT_MISSING";
            r.field   = "boundary_elements." + s.component_id();
            r.stage   = s.name();
            r.message = "Cannot compute because component '" + s.component_id() +
                        "' of stage '" + s.name() +
                        "' is required for heat delivery but lies outside the declared boundary.";
            r.why     = "Every system must be assessed against the same complete delivery boundary.";
            throw RefusalError(std::move(r));
        }
    }
}

void require_positive_input_exergy(const ValueSpec& ex_in) {
    if (!(ex_in.value() > 0.0)) {
        std::ostringstream oss;
        oss << "Cannot compute exergy efficiency because input exergy is "
            << ex_in.value() << ' ' << ex_in.unit() << '.';
        refuse(RefusalKind::ZeroInputExergy, "REFUSE_EXERGY_INPUT_NONPOSITIVE", ex_in.label(),
               oss.str(), "Efficiency is only defined for a positive exergy input.");
    }
}

} // namespace Guardrails
} // namespace ExergySim
