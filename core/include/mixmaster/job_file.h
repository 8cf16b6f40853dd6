#pragma once
#include "config.h"
#include "types.h"

#include <ctime>
#include <filesystem>
#include <string>

namespace mixmaster {

constexpr const char* kJobFileExtension = ".ini";
constexpr const char* kJobGroup = "job";
constexpr const char* kMessageKeyPrefix = "message.";

// Same-second submissions get "-1", "-2", ... appended to the name; this
// many suffixes are tried before giving up.
constexpr int kMaxNameCollisions = 99;

// A job file as read back from disk.
struct JobFile {
    ResolvedJob job;   // record.target and matched_target_key are both the matched key
    std::string mailto;
    std::string mode;
};

// "YYYYMMDD-HHMMSS" in local time.
std::string job_file_stem(std::time_t t);

// Serializes the job as a single [job] group. Every key and value is
// escaped, so commit messages cannot inject keys or groups.
std::string encode_job_file(const ResolvedJob& job, const Settings& settings);

// Inverse of encode_job_file.
bool decode_job_file(const std::string& text, JobFile* out, std::string* err);

// Writes the job into settings.spool. The content goes to a hidden
// temporary file first and is then hard-linked under its final name, which
// fails instead of overwriting when the name is taken. The spool directory
// must already exist.
// WRITE_FAILURE on any error (detail for the log); *written gets the path.
Outcome write_job_file(const ResolvedJob& job, const Settings& settings,
                       std::time_t now, std::filesystem::path* written);

} // namespace mixmaster
