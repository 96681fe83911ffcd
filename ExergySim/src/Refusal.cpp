#include "Refusal.hpp"

#include <sstream>
#include <utility>

namespace ExergySim {

const char* to_string(RefusalKind kind) {
    switch (kind) {
        case RefusalKind::MissingInput:                return "MissingInput";
        case RefusalKind::InvalidTemperatureBoundary:  return "InvalidTemperatureBoundary";
        case RefusalKind::IncompleteChain:             return "IncompleteChain";
        case RefusalKind::MissingBoundaryElement:      return "MissingBoundaryElement";
        case RefusalKind::ZeroInputExergy:             return "ZeroInputExergy";
        case RefusalKind::ComputationIntegrityFailure: return "ComputationIntegrityFailure";
        case RefusalKind::UnitMismatch:                return "UnitMismatch";
        case RefusalKind::AmbiguousUnit:               return "AmbiguousUnit";
        case RefusalKind::InvalidValue:                return "InvalidValue";
        case RefusalKind::MissingProvenance:           return "MissingProvenance";
    }
    return "Unknown";
}

std::string Refusal::describe() const {
    std::ostringstream oss;
    oss << to_string(kind);
    if (!code.empty())  oss << " [" << code << "]";
    if (!field.empty()) oss << " field=" << field;
    if (!stage.empty()) oss << " stage=" << stage;
    if (step)           oss << " step=" << *step;
    oss << ": " << message;
    return oss.str();
}

RefusalError::RefusalError(Refusal refusal)
    : std::runtime_error(refusal.describe()),
      refusal_(std::move(refusal)) {}

RefusalError RefusalError::at(int step, const std::string& stage) const {
    Refusal r = refusal_;
    if (!r.step) r.step = step;
    if (r.stage.empty()) r.stage = stage;
    return RefusalError(std::move(r));
}

} // namespace ExergySim
