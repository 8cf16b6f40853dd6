#include "mixmaster/response.h"

#include <sstream>

namespace mixmaster {

int status_for(OutcomeKind k) {
    switch (k) {
        case OutcomeKind::OK:                 return 204;
        case OutcomeKind::MALFORMED_REQUEST:  return 400;
        case OutcomeKind::NOT_FOUND:          return 404;
        case OutcomeKind::METHOD_NOT_ALLOWED: return 405;
        case OutcomeKind::VALIDATION_ERROR:
        case OutcomeKind::UNKNOWN_PROJECT:
        case OutcomeKind::UNKNOWN_TARGET:
        case OutcomeKind::UNKNOWN_TASK:
        case OutcomeKind::AMBIGUOUS_TARGET:   return 422;
        case OutcomeKind::WRITE_FAILURE:      return 500;
        case OutcomeKind::CONFIG_MISSING:
        case OutcomeKind::CONFIG_INVALID:     return 503;
    }
    return 400;
}

const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 422: return "Unprocessable Entity";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
    }
    return "Error";
}

Response response_for(const Outcome& o) {
    Response r;
    r.status = status_for(o.kind);
    if (o.kind == OutcomeKind::METHOD_NOT_ALLOWED) {
        r.headers.emplace_back("Allow", o.detail);
    }
    if (r.status == 422) {
        r.body = outcome_message(o) + "\n";
    }
    return r;
}

Response version_response() {
    Response r;
    r.status = 200;
    r.body = std::string(MIXMASTER_VERSION) + "\n";
    return r;
}

std::string format_response(const Response& r) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << r.status << " " << reason_phrase(r.status) << "\r\n";
    oss << "Connection: close\r\n";
    for (const auto& h : r.headers) {
        oss << h.first << ": " << h.second << "\r\n";
    }
    if (!r.body.empty()) {
        oss << "Content-Type: text/plain; charset=utf-8\r\n";
        oss << "Content-Length: " << r.body.size() << "\r\n";
    } else if (r.status != 204) {
        oss << "Content-Length: 0\r\n";
    }
    oss << "\r\n";
    if (!r.head_only) oss << r.body;
    return oss.str();
}

bool write_response(std::ostream& out, const Response& r) {
    out << format_response(r);
    out.flush();
    return static_cast<bool>(out);
}

} // namespace mixmaster
