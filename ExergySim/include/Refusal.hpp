#pragma once
#include <optional>
#include <stdexcept>
#include <string>

namespace ExergySim {

// Classified reasons a computation is refused. ComputationIntegrityFailure is
// the only kind that points at a defect in a loss model rather than at the
// scenario the user supplied.
enum class RefusalKind {
    MissingInput,
    InvalidTemperatureBoundary,
    IncompleteChain,
    MissingBoundaryElement,
    ZeroInputExergy,
    ComputationIntegrityFailure,
    UnitMismatch,
    AmbiguousUnit,
    InvalidValue,
    MissingProvenance
};

const char* to_string(RefusalKind kind);

struct Refusal {
    RefusalKind kind = RefusalKind::MissingInput;
    std::string code;      // rule code, e.g. REFUSE_INPUT_MISSING
    std::string field;     // offending field ("T0", "stage.inputs.efficiency", ...)
    std::string message;   // user-facing sentence
    std::string why;       // rule rationale shown under the message

    // Filled in by the simulation loop when the refusal happens inside a step.
    std::optional<int> step;
    std::string stage;

    bool is_integrity_failure() const {
        return kind == RefusalKind::ComputationIntegrityFailure;
    }

    // One line: "<Kind> [<code>] field=<field> stage=<stage> step=<n>: <message>"
    std::string describe() const;
};

class RefusalError : public std::runtime_error {
public:
    explicit RefusalError(Refusal refusal);

    const Refusal& refusal() const noexcept { return refusal_; }

    // Copy of this error with run context attached. Context already present
    // is kept (innermost stage wins).
    RefusalError at(int step, const std::string& stage) const;

private:
    Refusal refusal_;
};

} // namespace ExergySim
