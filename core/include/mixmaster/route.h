#pragma once
#include "config.h"
#include "types.h"

#include <map>
#include <string>
#include <vector>

namespace mixmaster {

constexpr const char* kVersionPath = "/version";

// The closed set of accepted wire shapes.
enum class PayloadShape {
    GITEA,       // Gitea/Gogs push webhook
    LIGHTWEIGHT, // flat JSON from scripts and other CI
    ADHOC,       // minimal command-line submissions
};

const char* shape_name(PayloadShape s);

enum class RouteKind { PAYLOAD, VERSION };

struct Route {
    RouteKind kind{RouteKind::PAYLOAD};
    PayloadShape shape{PayloadShape::LIGHTWEIGHT};
    std::vector<std::string> methods;
};

// Exact path -> route lookup, built once from the settings.
class RouteTable {
public:
    explicit RouteTable(const Settings& settings);

    // NOT_FOUND for an unknown path, METHOD_NOT_ALLOWED (detail: the
    // allowed methods, comma separated) for a known path with another method.
    Outcome match(const std::string& method, const std::string& path, const Route** out) const;

private:
    std::map<std::string, Route> routes_;
};

} // namespace mixmaster
