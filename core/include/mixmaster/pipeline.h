#pragma once
#include "config.h"
#include "response.h"
#include "route.h"
#include "types.h"

#include <ctime>
#include <filesystem>
#include <functional>
#include <istream>
#include <ostream>
#include <string>

namespace mixmaster {

using Clock = std::function<std::time_t()>;

struct PipelineOptions {
    std::filesystem::path config_path;
    Clock clock;                        // empty: std::time(nullptr)
    std::ostream* log_stream{nullptr};  // overrides the configured log destination
};

struct PipelineResult {
    Outcome outcome;
    Response response;
    std::filesystem::path job_file;     // set when a job was written
    ResolvedJob job;                    // valid when job_file is set
};

// normalize -> resolve -> write for one body. Nothing is written unless
// resolution succeeded.
Outcome ingest_payload(PayloadShape shape, const std::string& body,
                       const Config& cfg, std::time_t now,
                       ResolvedJob* job, std::filesystem::path* written);

// Routes an already-read request and runs it to a response.
PipelineResult process_request(const IncomingRequest& req, const Config& cfg, const Clock& clock);

// One connection end to end: load the configuration, read the request,
// process it and write exactly one response to out. Exceptions from any
// stage become MALFORMED_REQUEST.
PipelineResult handle_connection(std::istream& in, std::ostream& out, const PipelineOptions& opts);

} // namespace mixmaster
