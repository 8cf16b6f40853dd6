#pragma once
#include "types.h"

#include <cstddef>
#include <istream>
#include <string>

namespace mixmaster {

// Cap on the header block (request line + headers).
constexpr size_t kMaxHeaderBytes = 64 * 1024;

// POST, PUT and PATCH must declare Content-Length; other methods may omit
// it and then have an empty body.
bool method_carries_body(const std::string& method);

// Reads one HTTP/1.x-shaped request: request line, headers up to the first
// empty line, then exactly Content-Length body bytes.
// Every failure is MALFORMED_REQUEST; detail says why (for the log only).
Outcome read_request(std::istream& in, size_t max_body, IncomingRequest* out);

} // namespace mixmaster
