#pragma once
#include "types.h"

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <unordered_map>

namespace mixmaster {

// Group name holding process-wide settings; never a project.
constexpr const char* kSettingsGroup = "_";

constexpr const char* kDefaultConfigPath = "/etc/mixmaster.ini";

enum class Mode { NORMAL, DRY_RUN };

// Parses "normal" / "dry-run" (case-insensitive, "dryrun" accepted).
// Returns false for anything else.
bool parse_mode(const std::string& s, Mode* out);

// Returns string name of mode, as written to job files.
const char* mode_name(Mode m);

// target name -> build command; iteration order is lexicographic.
using TargetTable = std::map<std::string, std::string>;
using ProjectTable = std::unordered_map<std::string, TargetTable>;

struct Settings {
    std::string spool{"/var/spool/mixmaster"};
    std::string notifications{"all"};
    Mode mode{Mode::NORMAL};
    std::string mailto;
    std::string log_path;                  // empty: stderr

    // Endpoint paths, one per payload shape. Deployments that expose
    // the shapes under other names only change these.
    std::string gitea_endpoint{"/gitea"};
    std::string lightweight_endpoint{"/"};
    std::string adhoc_endpoint{"/adhoc"};

    size_t max_body_bytes{2 * 1024 * 1024};
};

struct Config {
    Settings settings;
    ProjectTable projects;

    // nullptr when the project is not configured.
    const TargetTable* targets_for(const std::string& project) const;
};

// --config value if given, else MIXMASTER_CONFIG, else kDefaultConfigPath.
std::filesystem::path resolve_config_path(const std::string& cli_value);

// CONFIG_MISSING if the file does not exist, CONFIG_INVALID if it cannot
// be read or parsed. detail carries the diagnostic for the log.
Outcome load_config(const std::filesystem::path& path, Config* out);

// Same as load_config, on text already in memory.
Outcome parse_config(const std::string& text, Config* out);

} // namespace mixmaster
