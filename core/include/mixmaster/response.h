#pragma once
#include "types.h"

#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace mixmaster {

struct Response {
    int status{200};
    std::vector<std::pair<std::string, std::string>> headers; // besides Connection/Content-*
    std::string body;                                         // plain text, may be empty
    bool head_only{false};                                    // HEAD: headers as for GET, no body
};

// Status code for an outcome. OK maps to 204 (job accepted, no body).
int status_for(OutcomeKind k);

const char* reason_phrase(int status);

// Maps any outcome to its response: validation and resolution failures
// carry a human-readable body, infrastructure failures a bare status.
Response response_for(const Outcome& o);

Response version_response();

// Status line, Connection: close, extra headers, Content-Type and
// Content-Length when there is a body (Content-Length: 0 otherwise, except
// for 204), blank line, body. A head_only response keeps the headers of
// its body but stops after the blank line.
std::string format_response(const Response& r);

// Returns false if the stream failed.
bool write_response(std::ostream& out, const Response& r);

} // namespace mixmaster
