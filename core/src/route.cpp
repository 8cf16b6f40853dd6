#include "mixmaster/route.h"

#include <algorithm>

namespace mixmaster {

const char* shape_name(PayloadShape s) {
    switch (s) {
        case PayloadShape::GITEA:       return "gitea";
        case PayloadShape::LIGHTWEIGHT: return "lightweight";
        case PayloadShape::ADHOC:       return "adhoc";
    }
    return "lightweight";
}

static Route payload_route(PayloadShape shape) {
    Route r;
    r.kind = RouteKind::PAYLOAD;
    r.shape = shape;
    r.methods = {"POST", "PUT"};
    return r;
}

RouteTable::RouteTable(const Settings& settings) {
    routes_[settings.gitea_endpoint] = payload_route(PayloadShape::GITEA);
    routes_[settings.lightweight_endpoint] = payload_route(PayloadShape::LIGHTWEIGHT);
    routes_[settings.adhoc_endpoint] = payload_route(PayloadShape::ADHOC);

    Route version;
    version.kind = RouteKind::VERSION;
    version.methods = {"GET", "HEAD"};
    routes_[kVersionPath] = version;
}

Outcome RouteTable::match(const std::string& method, const std::string& path, const Route** out) const {
    auto it = routes_.find(path);
    if (it == routes_.end()) {
        return Outcome::fail(OutcomeKind::NOT_FOUND, path);
    }
    const Route& r = it->second;
    if (std::find(r.methods.begin(), r.methods.end(), method) == r.methods.end()) {
        std::string allow;
        for (const auto& m : r.methods) {
            if (!allow.empty()) allow += ", ";
            allow += m;
        }
        return Outcome::fail(OutcomeKind::METHOD_NOT_ALLOWED, allow);
    }
    if (out) *out = &r;
    return Outcome::success();
}

} // namespace mixmaster
