#include "cmd_submit.h"
#include "runner_utils.h"

#include "mixmaster/config.h"
#include "mixmaster/log.h"
#include "mixmaster/pipeline.h"
#include "mixmaster/route.h"

#include <ctime>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

using namespace mixmaster;

// Standalone ingestion: a JSON body on stdin goes through the same
// normalize/resolve/write steps as a webhook, without HTTP framing.
// Usage: mmbridge submit [--config PATH] [--endpoint PATH]
// The endpoint selects the payload shape; default is the adhoc endpoint.
int cmd_submit(int argc, char** argv, int first_arg) {
    std::string config_flag;
    std::string endpoint;
    for (int i = first_arg; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) { config_flag = argv[++i]; continue; }
        if (a == "--endpoint" && i + 1 < argc) { endpoint = argv[++i]; continue; }
        std::cerr << "usage: mmbridge submit [--config PATH] [--endpoint PATH] < body.json\n";
        return 2;
    }

    const auto config_path = resolve_config_path(config_flag);
    Config cfg;
    Outcome o = load_config(config_path, &cfg);
    if (!o.ok()) {
        std::cerr << outcome_kind_to_str(o.kind) << ": " << o.detail << "\n";
        return exit_code_for(o);
    }
    if (endpoint.empty()) endpoint = cfg.settings.adhoc_endpoint;

    std::unique_ptr<EventLog> log = cfg.settings.log_path.empty()
        ? std::make_unique<EventLog>()
        : std::make_unique<EventLog>(cfg.settings.log_path);

    RouteTable routes(cfg.settings);
    const Route* route = nullptr;
    o = routes.match("POST", endpoint, &route);
    if (!o.ok() || route->kind != RouteKind::PAYLOAD) {
        std::cerr << "unknown endpoint: " << endpoint << "\n";
        return 2;
    }

    std::string body;
    if (!slurp_stream(std::cin, cfg.settings.max_body_bytes, &body)) {
        std::cerr << "body exceeds " << cfg.settings.max_body_bytes << " bytes\n";
        return 1;
    }

    ResolvedJob job;
    std::filesystem::path written;
    o = ingest_payload(route->shape, body, cfg, std::time(nullptr), &job, &written);
    if (!o.ok()) {
        log->event("rejected", {
            {"kind", outcome_kind_to_str(o.kind)},
            {"detail", o.detail},
            {"source", "submit"},
        });
        std::string msg = outcome_message(o);
        std::cerr << outcome_kind_to_str(o.kind) << (msg.empty() ? "" : ": " + msg) << "\n";
        return exit_code_for(o);
    }

    log->event("job", {
        {"file", written.string()},
        {"project", job.record.project},
        {"target", job.matched_target_key},
        {"commit", job.record.commit},
        {"source", "submit"},
    });
    std::cout << written.string() << "\n";
    return 0;
}
