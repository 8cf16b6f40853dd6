#include "mixmaster/config.h"
#include "mixmaster/ini.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace mixmaster {

bool parse_mode(const std::string& s, Mode* out) {
    std::string val(s);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "normal") { *out = Mode::NORMAL; return true; }
    if (val == "dry-run" || val == "dryrun") { *out = Mode::DRY_RUN; return true; }
    return false;
}

const char* mode_name(Mode m) {
    switch (m) {
        case Mode::DRY_RUN: return "dry-run";
        case Mode::NORMAL:  return "normal";
    }
    return "normal";
}

const TargetTable* Config::targets_for(const std::string& project) const {
    auto it = projects.find(project);
    if (it == projects.end()) return nullptr;
    return &it->second;
}

std::filesystem::path resolve_config_path(const std::string& cli_value) {
    if (!cli_value.empty()) return cli_value;
    const char* env = std::getenv("MIXMASTER_CONFIG");
    if (env && *env) return env;
    return kDefaultConfigPath;
}

static bool parse_size(const std::string& s, size_t* out) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    try {
        *out = static_cast<size_t>(std::stoull(s));
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

static Outcome apply_settings(const IniSection& sec, Settings* s) {
    for (const auto& kv : sec.entries) {
        const std::string& k = kv.first;
        const std::string& v = kv.second;
        if (k == "spool") {
            s->spool = v;
        } else if (k == "notifications") {
            s->notifications = v;
        } else if (k == "mode") {
            if (!parse_mode(v, &s->mode)) {
                return Outcome::fail(OutcomeKind::CONFIG_INVALID, "unknown mode: " + v);
            }
        } else if (k == "mailto") {
            s->mailto = v;
        } else if (k == "log") {
            s->log_path = v;
        } else if (k == "giteaEndpoint") {
            s->gitea_endpoint = v;
        } else if (k == "lightweightEndpoint") {
            s->lightweight_endpoint = v;
        } else if (k == "adhocEndpoint") {
            s->adhoc_endpoint = v;
        } else if (k == "maxBodyBytes") {
            if (!parse_size(v, &s->max_body_bytes) || s->max_body_bytes == 0) {
                return Outcome::fail(OutcomeKind::CONFIG_INVALID, "bad maxBodyBytes: " + v);
            }
        }
        // Unknown keys are left for other tools sharing the file.
    }

    if (s->spool.empty()) {
        return Outcome::fail(OutcomeKind::CONFIG_INVALID, "spool must not be empty");
    }
    const std::string* endpoints[] = {&s->gitea_endpoint, &s->lightweight_endpoint, &s->adhoc_endpoint};
    for (const std::string* e : endpoints) {
        if (e->empty() || (*e)[0] != '/' || *e == "/version") {
            return Outcome::fail(OutcomeKind::CONFIG_INVALID, "bad endpoint path: " + *e);
        }
    }
    if (s->gitea_endpoint == s->lightweight_endpoint ||
        s->gitea_endpoint == s->adhoc_endpoint ||
        s->lightweight_endpoint == s->adhoc_endpoint) {
        return Outcome::fail(OutcomeKind::CONFIG_INVALID, "endpoint paths must be distinct");
    }
    return Outcome::success();
}

Outcome parse_config(const std::string& text, Config* out) {
    IniDocument doc;
    std::string err;
    if (!ini_parse(text, &doc, &err)) {
        return Outcome::fail(OutcomeKind::CONFIG_INVALID, err);
    }

    Config cfg;
    for (const auto& sec : doc.sections) {
        if (sec.name == kSettingsGroup) {
            Outcome o = apply_settings(sec, &cfg.settings);
            if (!o.ok()) return o;
            continue;
        }
        TargetTable& targets = cfg.projects[sec.name];
        for (const auto& kv : sec.entries) targets[kv.first] = kv.second;
    }

    if (out) *out = std::move(cfg);
    return Outcome::success();
}

Outcome load_config(const std::filesystem::path& path, Config* out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Outcome::fail(OutcomeKind::CONFIG_MISSING, path.string());
    }
    std::ifstream f(path);
    if (!f) {
        return Outcome::fail(OutcomeKind::CONFIG_INVALID, "cannot open: " + path.string());
    }
    std::stringstream ss;
    ss << f.rdbuf();
    if (f.bad()) {
        return Outcome::fail(OutcomeKind::CONFIG_INVALID, "cannot read: " + path.string());
    }

    Outcome o = parse_config(ss.str(), out);
    if (!o.ok()) o.detail = path.string() + ": " + o.detail;
    return o;
}

} // namespace mixmaster
