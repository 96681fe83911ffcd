#pragma once
#include <optional>
#include <string>
#include <vector>

#include "Refusal.hpp"
#include "ValueSpec.hpp"

namespace ExergySim {

class Scenario;
class Stage;

// The single authority for refusal. Every rule is a pure, deterministic
// function: it returns normally when the rule passes and throws RefusalError
// otherwise. No rule substitutes a default for a missing input.
namespace Guardrails {

// ---------- presence ----------

// MissingInput when `v` is absent.
const ValueSpec& require_present(const std::optional<ValueSpec>& v, const std::string& field);
const ValueSpec& require_present(const ValueSpec* v, const std::string& field);

// MissingInput when `text` is empty.
void require_non_empty(const std::string& text, const std::string& field);

// ---------- value rules ----------

// InvalidValue for NaN / inf.
void require_finite(double value, const std::string& field);

void require_positive(const ValueSpec& v, const std::string& field);
void require_non_negative(const ValueSpec& v, const std::string& field);

// InvalidValue unless 0 <= v <= 1.
void require_fraction(const ValueSpec& v, const std::string& field);

// ---------- unit / provenance rules ----------

// UnitMismatch when v.unit() != unit. No conversion is ever attempted.
void require_unit(const ValueSpec& v, const std::string& unit, const std::string& field);

// AmbiguousUnit for Wh/kWh/MWh/GWh without a declared energy kind.
void require_unambiguous_energy(const ValueSpec& v, const std::string& field);

// MissingProvenance when the detail required by the source type is absent.
void require_provenance(const ValueSpec& v);

// ---------- physics / structure rules ----------

// InvalidTemperatureBoundary when Tb <= T0. Equality is refused too: the
// exergy-of-heat shortcut is defined as inapplicable there, not degenerate.
void require_boundary_validity(const ValueSpec& T0, const ValueSpec& Tb);

// IncompleteChain when the chain is empty or its last stage is not DELIVER.
void require_chain_terminates_in_delivery(const std::vector<Stage>& stages);

// InvalidValue when two stages share a name (records are keyed by it).
void require_unique_stage_names(const std::vector<Stage>& stages);

// MissingBoundaryElement when a component the scenario flags as required for
// delivery is not inside its declared boundary.
void require_boundary_completeness(const Scenario& scenario);

// Same, for components flagged required by the stages of a chain.
void require_boundary_completeness(const Scenario& scenario, const std::vector<Stage>& stages);

// ZeroInputExergy when ex_in <= 0.
void require_positive_input_exergy(const ValueSpec& ex_in);

} // namespace Guardrails
} // namespace ExergySim
