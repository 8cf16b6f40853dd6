#include "mixmaster/log.h"

#include <json-c/json.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace mixmaster {

static std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Serialize a flat JSON object with sorted keys so log lines diff and grep
// the same way every time.
static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    std::vector<std::string> keys;
    json_object_object_foreach(obj, k, v) {
        (void)v;
        keys.emplace_back(k);
    }
    std::sort(keys.begin(), keys.end());

    out << "{";
    for (size_t i = 0; i < keys.size(); i++) {
        if (i > 0) out << ",";
        json_object* ks = json_object_new_string(keys[i].c_str());
        out << json_object_to_json_string_ext(ks, JSON_C_TO_STRING_PLAIN);
        json_object_put(ks);
        out << ":";
        json_object* val = nullptr;
        json_object_object_get_ex(obj, keys[i].c_str(), &val);
        out << (val ? json_object_to_json_string_ext(val, JSON_C_TO_STRING_PLAIN) : "null");
    }
    out << "}";
}

std::string format_event(const std::string& name, const LogFields& fields,
                         const std::string& ts, long pid) {
    json_object* rec = json_object_new_object();
    for (const auto& kv : fields) {
        json_object_object_add(rec, kv.first.c_str(),
                               json_object_new_string_len(kv.second.c_str(), (int)kv.second.size()));
    }
    json_object_object_add(rec, "event", json_object_new_string(name.c_str()));
    json_object_object_add(rec, "pid", json_object_new_int64(pid));
    json_object_object_add(rec, "ts", json_object_new_string(ts.c_str()));

    std::ostringstream line;
    canonical_serialize(rec, line);
    json_object_put(rec);
    return line.str();
}

EventLog::EventLog() : out_(&std::cerr) {}

EventLog::EventLog(std::ostream& out) : out_(&out) {}

EventLog::EventLog(const std::string& path)
    : file_(path, std::ios::out | std::ios::app), out_(&file_) {
    if (!file_) {
        std::cerr << "[mixmaster] cannot open log " << path << ", logging to stderr\n";
        out_ = &std::cerr;
    }
}

void EventLog::event(const std::string& name, const LogFields& fields) {
    *out_ << format_event(name, fields, iso_now(), (long)::getpid()) << "\n";
    out_->flush();
}

} // namespace mixmaster
