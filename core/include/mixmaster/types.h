#pragma once
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#ifndef MIXMASTER_VERSION
#define MIXMASTER_VERSION "0.0.0-dev"
#endif

namespace mixmaster {

// Every way a request can end. OK is the only non-failure.
enum class OutcomeKind {
    OK,
    CONFIG_MISSING,
    CONFIG_INVALID,
    MALFORMED_REQUEST,
    VALIDATION_ERROR,
    UNKNOWN_PROJECT,
    UNKNOWN_TARGET,
    UNKNOWN_TASK,
    AMBIGUOUS_TARGET,
    WRITE_FAILURE,
    NOT_FOUND,
    METHOD_NOT_ALLOWED,
};

// Result of one pipeline stage.
// detail: the missing field, project, target or task name; the allowed
// methods for METHOD_NOT_ALLOWED; internal diagnostics for infrastructure
// failures (logged, never sent to the caller).
struct Outcome {
    OutcomeKind kind{OutcomeKind::OK};
    std::string detail;
    std::vector<std::string> candidates; // AMBIGUOUS_TARGET only

    bool ok() const { return kind == OutcomeKind::OK; }

    static Outcome success() { return Outcome{}; }
    static Outcome fail(OutcomeKind k, std::string detail = "");
};

const char* outcome_kind_to_str(OutcomeKind k);

// Human-readable text for validation and resolution failures.
// Empty for kinds whose response carries no body.
std::string outcome_message(const Outcome& o);

struct IncomingRequest {
    std::string method;
    std::string path;
    std::string protocol_version;
    std::unordered_map<std::string, std::string> headers; // lower-cased keys
    std::string body;

    // Empty string when the header is absent.
    std::string header(const std::string& key_lower) const;
};

// Canonical build request, independent of the wire shape it arrived in.
struct JobRecord {
    std::string scm;
    std::string repository_url;
    std::string project;
    std::string target;
    std::string task;
    std::string commit;
    std::string view_url;
    std::string notifications;
    std::map<std::string, std::string> commit_messages; // commit id -> message
};

struct ResolvedJob {
    JobRecord record;
    std::string build_command;
    std::string matched_target_key;
};

} // namespace mixmaster
