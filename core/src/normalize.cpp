#include "mixmaster/normalize.h"
#include "mixmaster/json_mini.h"

#include <string>
#include <utility>

namespace mixmaster {

namespace {

constexpr const char* kBranchPrefix = "refs/heads/";

struct NormalizerEntry {
    PayloadShape shape;
    NormalizeFn fn;
};

const NormalizerEntry kNormalizers[] = {
    {PayloadShape::GITEA,       normalize_gitea},
    {PayloadShape::LIGHTWEIGHT, normalize_lightweight},
    {PayloadShape::ADHOC,       normalize_adhoc},
};

// Reads a required string field. Fields that identify the project or the
// target must also be non-empty.
bool require(json_object* o, const char* key, bool non_empty, std::string* out) {
    if (!json_mini::get_string(o, key, out)) return false;
    return !(non_empty && out->empty());
}

Outcome missing(const std::string& field) {
    return Outcome::fail(OutcomeKind::VALIDATION_ERROR, field);
}

} // namespace

std::string strip_branch_prefix(const std::string& ref) {
    std::string out = ref;
    size_t p = out.find(kBranchPrefix);
    if (p != std::string::npos) out.erase(p, std::char_traits<char>::length(kBranchPrefix));
    return out;
}

Outcome normalize_gitea(json_object* body, const Settings& settings, JobRecord* out) {
    JobRecord rec;
    rec.scm = "git";
    rec.notifications = settings.notifications;

    json_object* repo = json_mini::get_object(body, "repository");
    if (!repo) return missing("repository");
    if (!require(repo, "ssh_url", false, &rec.repository_url)) return missing("repository.ssh_url");
    if (!require(repo, "full_name", true, &rec.project)) return missing("repository.full_name");

    std::string ref;
    if (!require(body, "ref", true, &ref)) return missing("ref");
    rec.target = strip_branch_prefix(ref);
    if (rec.target.empty()) return missing("ref");

    if (!require(body, "after", false, &rec.commit)) return missing("after");
    rec.view_url = json_mini::get_string_or(body, "compare_url", "");

    json_object* commits = json_mini::get_array(body, "commits");
    if (commits) {
        const size_t n = json_object_array_length(commits);
        for (size_t i = 0; i < n; i++) {
            json_object* c = json_object_array_get_idx(commits, i);
            if (!c || !json_object_is_type(c, json_type_object)) continue;
            if (i == 0 && rec.view_url.empty()) {
                rec.view_url = json_mini::get_string_or(c, "url", "");
            }
            std::string id;
            std::string message;
            if (!json_mini::get_string(c, "id", &id)) continue;
            if (!json_mini::get_string(c, "message", &message)) continue;
            rec.commit_messages[id] = message;
        }
    }

    if (out) *out = std::move(rec);
    return Outcome::success();
}

Outcome normalize_lightweight(json_object* body, const Settings& settings, JobRecord* out) {
    JobRecord rec;
    if (!require(body, "scm", false, &rec.scm)) return missing("scm");
    if (!require(body, "repositoryUrl", false, &rec.repository_url)) return missing("repositoryUrl");
    if (!require(body, "project", true, &rec.project)) return missing("project");
    if (!require(body, "target", true, &rec.target)) return missing("target");

    rec.notifications = json_mini::get_string_or(body, "notifications", settings.notifications);
    rec.view_url = json_mini::get_string_or(body, "viewUrl", "");
    rec.commit = json_mini::get_string_or(body, "commit", "");
    rec.task = json_mini::get_string_or(body, "task", "");

    std::string message;
    if (json_mini::get_string(body, "message", &message)) {
        rec.commit_messages[rec.commit] = message;
    }

    if (out) *out = std::move(rec);
    return Outcome::success();
}

Outcome normalize_adhoc(json_object* body, const Settings& settings, JobRecord* out) {
    JobRecord rec;
    rec.notifications = settings.notifications;
    if (!require(body, "scm", false, &rec.scm)) return missing("scm");
    if (!require(body, "repositoryUrl", false, &rec.repository_url)) return missing("repositoryUrl");
    if (!require(body, "repositoryName", true, &rec.project)) return missing("repositoryName");
    if (!require(body, "commit", false, &rec.commit)) return missing("commit");
    if (!require(body, "branch", true, &rec.target)) return missing("branch");

    rec.view_url = json_mini::get_string_or(body, "viewUrl", "");
    rec.task = json_mini::get_string_or(body, "task", "");

    if (out) *out = std::move(rec);
    return Outcome::success();
}

NormalizeFn normalizer_for(PayloadShape shape) {
    for (const auto& e : kNormalizers) {
        if (e.shape == shape) return e.fn;
    }
    return nullptr;
}

Outcome normalize_payload(PayloadShape shape, const std::string& body,
                          const Settings& settings, JobRecord* out) {
    json_mini::Doc doc = json_mini::parse(body);
    if (!doc) {
        return Outcome::fail(OutcomeKind::MALFORMED_REQUEST, "body: " + doc.error);
    }
    if (!json_object_is_type(doc.root, json_type_object)) {
        return Outcome::fail(OutcomeKind::MALFORMED_REQUEST, "body is not a JSON object");
    }
    NormalizeFn fn = normalizer_for(shape);
    if (!fn) {
        return Outcome::fail(OutcomeKind::NOT_FOUND, shape_name(shape));
    }
    return fn(doc.root, settings, out);
}

} // namespace mixmaster
