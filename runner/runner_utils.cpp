#include "runner_utils.h"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>

namespace mixmaster {

int exit_code_for(const Outcome& o) {
    switch (o.kind) {
        case OutcomeKind::OK:             return 0;
        case OutcomeKind::CONFIG_MISSING:
        case OutcomeKind::CONFIG_INVALID: return 2;
        default:                          return 1;
    }
}

bool slurp_stream(std::istream& in, size_t max_bytes, std::string* out) {
    std::string data;
    char rbuf[8192];
    while (in.read(rbuf, sizeof(rbuf)) || in.gcount()) {
        data.append(rbuf, static_cast<size_t>(in.gcount()));
        if (data.size() > max_bytes) return false;
    }
    if (out) *out = std::move(data);
    return true;
}

namespace runner_detail {
int getenv_int(const char* k, int defv) {
    if (const char* e = std::getenv(k)) {
        try { return std::stoi(e); } catch (const std::logic_error&) { return defv; }
    }
    return defv;
}
} // namespace runner_detail

} // namespace mixmaster
