#pragma once
#include <fstream>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace mixmaster {

using LogFields = std::vector<std::pair<std::string, std::string>>;

// JSON-lines event log. Each line is one object with sorted keys:
// the caller's fields plus "event", "pid" and "ts" (UTC, ISO-8601).
class EventLog {
public:
    // Logs to stderr.
    EventLog();
    // Logs to an external stream (not owned).
    explicit EventLog(std::ostream& out);
    // Appends to path; falls back to stderr if it cannot be opened.
    explicit EventLog(const std::string& path);

    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    void event(const std::string& name, const LogFields& fields);

private:
    std::ofstream file_;
    std::ostream* out_;
};

// Canonical one-line JSON (sorted keys) for a flat string map plus event
// name, pid and timestamp. Exposed for tests.
std::string format_event(const std::string& name, const LogFields& fields,
                         const std::string& ts, long pid);

} // namespace mixmaster
