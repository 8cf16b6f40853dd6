#include "mixmaster/types.h"

#include <sstream>
#include <utility>

namespace mixmaster {

Outcome Outcome::fail(OutcomeKind k, std::string detail) {
    Outcome o;
    o.kind = k;
    o.detail = std::move(detail);
    return o;
}

const char* outcome_kind_to_str(OutcomeKind k) {
    switch (k) {
        case OutcomeKind::OK:                 return "OK";
        case OutcomeKind::CONFIG_MISSING:     return "CONFIG_MISSING";
        case OutcomeKind::CONFIG_INVALID:     return "CONFIG_INVALID";
        case OutcomeKind::MALFORMED_REQUEST:  return "MALFORMED_REQUEST";
        case OutcomeKind::VALIDATION_ERROR:   return "VALIDATION_ERROR";
        case OutcomeKind::UNKNOWN_PROJECT:    return "UNKNOWN_PROJECT";
        case OutcomeKind::UNKNOWN_TARGET:     return "UNKNOWN_TARGET";
        case OutcomeKind::UNKNOWN_TASK:       return "UNKNOWN_TASK";
        case OutcomeKind::AMBIGUOUS_TARGET:   return "AMBIGUOUS_TARGET";
        case OutcomeKind::WRITE_FAILURE:      return "WRITE_FAILURE";
        case OutcomeKind::NOT_FOUND:          return "NOT_FOUND";
        case OutcomeKind::METHOD_NOT_ALLOWED: return "METHOD_NOT_ALLOWED";
    }
    return "MALFORMED_REQUEST";
}

std::string outcome_message(const Outcome& o) {
    switch (o.kind) {
        case OutcomeKind::VALIDATION_ERROR:
            return "Missing required field: " + o.detail;
        case OutcomeKind::UNKNOWN_PROJECT:
            return "Unknown project: " + o.detail;
        case OutcomeKind::UNKNOWN_TARGET:
            return "No configured target matches: " + o.detail;
        case OutcomeKind::UNKNOWN_TASK:
            return "No configured task matches: " + o.detail;
        case OutcomeKind::AMBIGUOUS_TARGET: {
            std::ostringstream oss;
            oss << "Ambiguous target " << o.detail << " matches:";
            for (size_t i = 0; i < o.candidates.size(); i++) {
                oss << (i == 0 ? " " : ", ") << o.candidates[i];
            }
            return oss.str();
        }
        default:
            return "";
    }
}

std::string IncomingRequest::header(const std::string& key_lower) const {
    auto it = headers.find(key_lower);
    if (it == headers.end()) return "";
    return it->second;
}

} // namespace mixmaster
