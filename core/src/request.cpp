#include "mixmaster/request.h"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace mixmaster {

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) b++;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) e--;
    return s.substr(b, e - b);
}

static std::string to_lower(std::string s) {
    for (char& c : s) if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    return s;
}

static bool parse_content_length(const std::string& v, size_t* out) {
    if (v.empty()) return false;
    for (char c : v) {
        if (c < '0' || c > '9') return false;
    }
    try {
        *out = static_cast<size_t>(std::stoull(v));
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

enum class LineRead { LINE, END, TOO_LONG };

// Reads up to and excluding '\n', charging every byte (newline included)
// to *budget. Nothing past the budget is consumed from the stream.
static LineRead read_line(std::istream& in, size_t* budget, std::string* line) {
    line->clear();
    char c;
    while (true) {
        if (*budget == 0) return LineRead::TOO_LONG;
        if (!in.get(c)) return LineRead::END;
        (*budget)--;
        if (c == '\n') return LineRead::LINE;
        line->push_back(c);
    }
}

bool method_carries_body(const std::string& method) {
    return method == "POST" || method == "PUT" || method == "PATCH";
}

Outcome read_request(std::istream& in, size_t max_body, IncomingRequest* out) {
    IncomingRequest req;
    bool have_request_line = false;
    bool terminated = false;
    size_t head_budget = kMaxHeaderBytes;
    std::string line;

    while (true) {
        LineRead lr = read_line(in, &head_budget, &line);
        if (lr == LineRead::TOO_LONG) {
            return Outcome::fail(OutcomeKind::MALFORMED_REQUEST, "header block too large");
        }
        if (lr == LineRead::END) break;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) {
            terminated = true;
            break;
        }

        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            std::string key = to_lower(trim(line.substr(0, colon)));
            req.headers[key] = trim(line.substr(colon + 1));
            continue;
        }

        // Only the first non-header line is the request line.
        if (have_request_line) continue;
        std::istringstream iss(line);
        std::string extra;
        if (!(iss >> req.method >> req.path >> req.protocol_version) || (iss >> extra)) {
            return Outcome::fail(OutcomeKind::MALFORMED_REQUEST, "bad request line");
        }
        have_request_line = true;
    }

    if (!terminated) {
        return Outcome::fail(OutcomeKind::MALFORMED_REQUEST, "stream ended inside header block");
    }
    if (!have_request_line) {
        return Outcome::fail(OutcomeKind::MALFORMED_REQUEST, "missing request line");
    }

    auto cl = req.headers.find("content-length");
    if (cl == req.headers.end()) {
        if (method_carries_body(req.method)) {
            return Outcome::fail(OutcomeKind::MALFORMED_REQUEST, "missing content-length");
        }
    } else {
        size_t n = 0;
        if (!parse_content_length(cl->second, &n)) {
            return Outcome::fail(OutcomeKind::MALFORMED_REQUEST, "bad content-length");
        }
        if (n > max_body) {
            return Outcome::fail(OutcomeKind::MALFORMED_REQUEST, "content-length exceeds limit");
        }
        req.body.resize(n);
        if (n > 0) {
            in.read(&req.body[0], static_cast<std::streamsize>(n));
            if (static_cast<size_t>(in.gcount()) != n) {
                return Outcome::fail(OutcomeKind::MALFORMED_REQUEST, "body shorter than content-length");
            }
        }
    }

    if (out) *out = std::move(req);
    return Outcome::success();
}

} // namespace mixmaster
