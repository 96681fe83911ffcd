#pragma once
#include <optional>
#include <string>

namespace ExergySim {

// Epistemic class of a number. The same value with a different source type
// is a different ValueSpec.
enum class SourceType { Measured, Assumed, Derived, External };

const char* to_string(SourceType s);

// Declared physical nature of an energy quantity. Wh-family units are
// ambiguous unless this is set.
enum class EnergyKind { Unspecified, Thermal, Electric, Chemical };

const char* to_string(EnergyKind k);

struct Citation {
    std::string document;
    int page = 0;
};

// Supporting detail for a ValueSpec. Which fields must be filled depends on
// the source type (see Guardrails::require_provenance):
//   measured -> source
//   assumed  -> note
//   external -> source + time_range
//   derived  -> tool
struct Provenance {
    std::string note;
    std::string source;
    std::string time_range;
    std::string tool;
    std::optional<Citation> citation;
    EnergyKind energy_kind = EnergyKind::Unspecified;
};

class ValueSpec {
public:
    // All four leading fields are mandatory; an empty unit or label refuses
    // with MissingInput, a non-finite value with InvalidValue.
    ValueSpec(double value,
              std::string unit,
              SourceType source_type,
              std::string label,
              Provenance provenance = {});

    double value() const { return value_; }
    const std::string& unit() const { return unit_; }
    SourceType source_type() const { return source_type_; }
    const std::string& label() const { return label_; }
    const Provenance& provenance() const { return provenance_; }
    EnergyKind energy_kind() const { return provenance_.energy_kind; }

    // e.g. "T0 = 280 K (assumed)"
    std::string describe() const;

    // Full tuple: value, unit, source type and label.
    bool operator==(const ValueSpec& other) const;
    bool operator!=(const ValueSpec& other) const { return !(*this == other); }

private:
    double      value_;
    std::string unit_;
    SourceType  source_type_;
    std::string label_;
    Provenance  provenance_;
};

// ---------- tagged constructors ----------

ValueSpec measured_value(double value, const std::string& unit,
                         const std::string& label, const std::string& source);

ValueSpec assumed_value(double value, const std::string& unit,
                        const std::string& label, const std::string& note);

ValueSpec external_value(double value, const std::string& unit,
                         const std::string& label, const std::string& source,
                         const std::string& time_range);

// Output of a deterministic tool; `tool` names the function that produced it.
ValueSpec derived_value(double value, const std::string& unit,
                        const std::string& label, const std::string& tool,
                        EnergyKind energy_kind = EnergyKind::Unspecified);

// Copy of `v` with the energy kind declared.
ValueSpec with_energy_kind(const ValueSpec& v, EnergyKind kind);

} // namespace ExergySim
