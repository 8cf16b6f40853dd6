#include "mixmaster/pipeline.h"
#include "mixmaster/job_file.h"
#include "mixmaster/log.h"
#include "mixmaster/normalize.h"
#include "mixmaster/request.h"
#include "mixmaster/resolve.h"

#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace mixmaster {

static std::time_t now_from(const Clock& clock) {
    return clock ? clock() : std::time(nullptr);
}

static std::unique_ptr<EventLog> make_log(const PipelineOptions& opts, const Settings* settings) {
    if (opts.log_stream) return std::make_unique<EventLog>(*opts.log_stream);
    if (settings && !settings->log_path.empty()) return std::make_unique<EventLog>(settings->log_path);
    return std::make_unique<EventLog>();
}

Outcome ingest_payload(PayloadShape shape, const std::string& body,
                       const Config& cfg, std::time_t now,
                       ResolvedJob* job, std::filesystem::path* written) {
    JobRecord rec;
    Outcome o = normalize_payload(shape, body, cfg.settings, &rec);
    if (!o.ok()) return o;

    ResolvedJob resolved;
    o = resolve_target(cfg, rec, &resolved);
    if (!o.ok()) return o;

    o = write_job_file(resolved, cfg.settings, now, written);
    if (!o.ok()) return o;

    if (job) *job = std::move(resolved);
    return Outcome::success();
}

PipelineResult process_request(const IncomingRequest& req, const Config& cfg, const Clock& clock) {
    PipelineResult res;
    RouteTable routes(cfg.settings);
    const Route* route = nullptr;
    res.outcome = routes.match(req.method, req.path, &route);
    if (!res.outcome.ok()) {
        res.response = response_for(res.outcome);
        return res;
    }

    if (route->kind == RouteKind::VERSION) {
        res.response = version_response();
        res.response.head_only = (req.method == "HEAD");
        return res;
    }

    res.outcome = ingest_payload(route->shape, req.body, cfg, now_from(clock), &res.job, &res.job_file);
    res.response = response_for(res.outcome);
    return res;
}

// Event-log failures go to stderr; they never cost the caller its response.
static void log_event(EventLog& log, const std::string& name, const LogFields& fields) {
    try {
        log.event(name, fields);
    } catch (const std::exception& e) {
        std::cerr << "[mixmaster] event log: " << e.what() << " (event " << name << ")\n";
    }
}

PipelineResult handle_connection(std::istream& in, std::ostream& out, const PipelineOptions& opts) {
    PipelineResult res;
    std::unique_ptr<EventLog> log;
    bool config_loaded = false;

    try {
        Config cfg;
        Outcome co = load_config(opts.config_path, &cfg);
        if (!co.ok()) {
            res.outcome = co;
            res.response = response_for(co);
        } else {
            config_loaded = true;
            log = make_log(opts, &cfg.settings);

            IncomingRequest req;
            Outcome ro = read_request(in, cfg.settings.max_body_bytes, &req);
            if (!ro.ok()) {
                res.outcome = ro;
                res.response = response_for(ro);
            } else {
                log_event(*log, "request", {
                    {"method", req.method},
                    {"path", req.path},
                    {"bytes", std::to_string(req.body.size())},
                });
                res = process_request(req, cfg, opts.clock);
            }
        }
    } catch (const std::exception& e) {
        // Before the configuration is usable this is a configuration
        // problem; afterwards it is blamed on the request.
        const OutcomeKind kind = config_loaded ? OutcomeKind::MALFORMED_REQUEST : OutcomeKind::CONFIG_INVALID;
        res = PipelineResult{};
        res.outcome = Outcome::fail(kind, e.what());
        res.response = response_for(res.outcome);
    }

    if (!log) log = make_log(opts, nullptr);

    if (!res.outcome.ok() && config_loaded) {
        log_event(*log, "rejected", {
            {"kind", outcome_kind_to_str(res.outcome.kind)},
            {"detail", res.outcome.detail},
            {"status", std::to_string(res.response.status)},
        });
    } else if (!res.outcome.ok()) {
        log_event(*log, "config_error", {
            {"kind", outcome_kind_to_str(res.outcome.kind)},
            {"detail", res.outcome.detail},
        });
    } else if (!res.job_file.empty()) {
        log_event(*log, "job", {
            {"file", res.job_file.string()},
            {"project", res.job.record.project},
            {"target", res.job.matched_target_key},
            {"commit", res.job.record.commit},
        });
    }

    if (!write_response(out, res.response)) {
        log_event(*log, "response_failed", {{"status", std::to_string(res.response.status)}});
    }
    return res;
}

} // namespace mixmaster
