#pragma once

#include "mixmaster/types.h"

#include <cstddef>
#include <istream>
#include <string>

namespace mixmaster {

// Process exit code for a pipeline outcome:
// 0 accepted, 2 configuration problem, 1 any other rejection.
int exit_code_for(const Outcome& o);

// Reads the whole stream. Returns false if it holds more than max_bytes.
bool slurp_stream(std::istream& in, size_t max_bytes, std::string* out);

namespace runner_detail {
int getenv_int(const char* k, int defv);
} // namespace runner_detail

} // namespace mixmaster
