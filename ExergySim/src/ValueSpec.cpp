#include "ValueSpec.hpp"
#include "Guardrails.hpp"

#include <sstream>
#include <utility>

namespace ExergySim {

const char* to_string(SourceType s) {
    switch (s) {
        case SourceType::Measured: return "measured";
        case SourceType::Assumed:  return "assumed";
        case SourceType::Derived:  return "derived";
        case SourceType::External: return "external";
    }
    return "unknown";
}

const char* to_string(EnergyKind k) {
    switch (k) {
        case EnergyKind::Unspecified: return "unspecified";
        case EnergyKind::Thermal:     return "thermal";
        case EnergyKind::Electric:    return "electric";
        case EnergyKind::Chemical:    return "chemical";
    }
    return "unknown";
}

ValueSpec::ValueSpec(double value,
                     std::string unit,
                     SourceType source_type,
                     std::string label,
                     Provenance provenance)
    : value_(value),
      unit_(std::move(unit)),
      source_type_(source_type),
      label_(std::move(label)),
      provenance_(std::move(provenance)) {
    // Label first so the unit refusal can name the quantity.
    Guardrails::require_non_empty(label_, "value.label");
    Guardrails::require_non_empty(unit_, label_ + ".unit");
    Guardrails::require_finite(value_, label_);
}

std::string ValueSpec::describe() const {
    std::ostringstream oss;
    oss << label_ << " = " << value_ << ' ' << unit_
        << " (" << to_string(source_type_) << ')';
    return oss.str();
}

bool ValueSpec::operator==(const ValueSpec& other) const {
    return value_ == other.value_ &&
           unit_ == other.unit_ &&
           source_type_ == other.source_type_ &&
           label_ == other.label_;
}

// ---------------- tagged constructors ----------------

ValueSpec measured_value(double value, const std::string& unit,
                         const std::string& label, const std::string& source) {
    Provenance p;
    p.source = source;
    return ValueSpec(value, unit, SourceType::Measured, label, p);
}

ValueSpec assumed_value(double value, const std::string& unit,
                        const std::string& label, const std::string& note) {
    Provenance p;
    p.note = note;
    return ValueSpec(value, unit, SourceType::Assumed, label, p);
}

ValueSpec external_value(double value, const std::string& unit,
                         const std::string& label, const std::string& source,
                         const std::string& time_range) {
    Provenance p;
    p.source     = source;
    p.time_range = time_range;
    return ValueSpec(value, unit, SourceType::External, label, p);
}

ValueSpec derived_value(double value, const std::string& unit,
                        const std::string& label, const std::string& tool,
                        EnergyKind energy_kind) {
    Provenance p;
    p.tool        = tool;
    p.energy_kind = energy_kind;
    return ValueSpec(value, unit, SourceType::Derived, label, p);
}

ValueSpec with_energy_kind(const ValueSpec& v, EnergyKind kind) {
    Provenance p = v.provenance();
    p.energy_kind = kind;
    return ValueSpec(v.value(), v.unit(), v.source_type(), v.label(), p);
}

} // namespace ExergySim
