#include "test_common.h"
#include "mixmaster/json_mini.h"
#include "mixmaster/normalize.h"

#include <string>
#include <utility>

using namespace mixmaster;

static const char* kGiteaPush = R"({
  "ref": "refs/heads/main",
  "before": "0000000000000000000000000000000000000000",
  "after": "a1b2c3d",
  "compare_url": "https://git.example.com/org/repo/compare/000...a1b2c3d",
  "commits": [
    {"id": "a1b2c3d", "message": "Fix the thing\n\nLonger body", "url": "https://git.example.com/org/repo/commit/a1b2c3d"},
    {"id": "e4f5a6b", "message": "Second commit"}
  ],
  "repository": {
    "full_name": "org/repo",
    "ssh_url": "git@git.example.com:org/repo.git",
    "clone_url": "https://git.example.com/org/repo.git"
  },
  "pusher": {"login": "someone"}
})";

static void expect_missing(PayloadShape shape, const std::string& body, const std::string& field) {
    Settings s;
    JobRecord rec;
    Outcome o = normalize_payload(shape, body, s, &rec);
    expect_true(o.kind == OutcomeKind::VALIDATION_ERROR,
                std::string(shape_name(shape)) + ": expected VALIDATION_ERROR for " + field);
    expect_eq_str(o.detail, field, std::string(shape_name(shape)) + ": first missing field");
}

static void test_strip_branch_prefix() {
    expect_eq_str(strip_branch_prefix("refs/heads/main"), "main", "plain branch");
    expect_eq_str(strip_branch_prefix("refs/heads/release/1.2"), "release/1.2", "branch with slash");
    expect_eq_str(strip_branch_prefix("refs/tags/v1"), "refs/tags/v1", "tags left alone");
    expect_eq_str(strip_branch_prefix("main"), "main", "bare name left alone");
    expect_eq_str(strip_branch_prefix("refs/heads/refs/heads/x"), "refs/heads/x", "only first occurrence removed");
}

static void test_gitea_push() {
    Settings s;
    s.notifications = "failure";
    JobRecord rec;
    Outcome o = normalize_payload(PayloadShape::GITEA, kGiteaPush, s, &rec);
    expect_true(o.ok(), "gitea push should normalize: " + o.detail);
    expect_eq_str(rec.scm, "git", "gitea implies git");
    expect_eq_str(rec.repository_url, "git@git.example.com:org/repo.git", "ssh url used");
    expect_eq_str(rec.project, "org/repo", "full_name is the project");
    expect_eq_str(rec.target, "main", "ref stripped to branch");
    expect_eq_str(rec.commit, "a1b2c3d", "after is the commit");
    expect_eq_str(rec.view_url, "https://git.example.com/org/repo/compare/000...a1b2c3d", "compare url");
    expect_eq_str(rec.notifications, "failure", "notifications from settings");
    expect_true(rec.task.empty(), "gitea carries no task");
    expect_eq_ll((long long)rec.commit_messages.size(), 2, "both commit messages kept");
    expect_eq_str(rec.commit_messages["a1b2c3d"], "Fix the thing\n\nLonger body", "multi-line message intact");
    expect_eq_str(rec.commit_messages["e4f5a6b"], "Second commit", "second message");
}

static void test_gitea_view_url_fallback() {
    Settings s;
    JobRecord rec;
    Outcome o = normalize_payload(PayloadShape::GITEA, R"({
        "ref": "refs/heads/dev", "after": "abc",
        "commits": [{"id": "abc", "message": "m", "url": "https://h/commit/abc"}],
        "repository": {"full_name": "org/repo", "ssh_url": "git@h:org/repo.git"}
    })", s, &rec);
    expect_true(o.ok(), "gitea without compare_url: " + o.detail);
    expect_eq_str(rec.view_url, "https://h/commit/abc", "first commit url used as view url");
    expect_eq_str(rec.notifications, "all", "default notifications");
}

static void test_gitea_missing_fields() {
    expect_missing(PayloadShape::GITEA, R"({"ref": "refs/heads/main", "after": "x"})", "repository");
    expect_missing(PayloadShape::GITEA, R"({"repository": "org/repo", "ref": "main", "after": "x"})", "repository");
    expect_missing(PayloadShape::GITEA,
                   R"({"repository": {"full_name": "org/repo"}, "ref": "main", "after": "x"})",
                   "repository.ssh_url");
    expect_missing(PayloadShape::GITEA,
                   R"({"repository": {"ssh_url": "git@h:r.git", "full_name": ""}, "ref": "main", "after": "x"})",
                   "repository.full_name");
    expect_missing(PayloadShape::GITEA,
                   R"({"repository": {"ssh_url": "git@h:r.git", "full_name": "org/repo"}, "after": "x"})",
                   "ref");
    expect_missing(PayloadShape::GITEA,
                   R"({"repository": {"ssh_url": "git@h:r.git", "full_name": "org/repo"}, "ref": "refs/heads/", "after": "x"})",
                   "ref");
    expect_missing(PayloadShape::GITEA,
                   R"({"repository": {"ssh_url": "git@h:r.git", "full_name": "org/repo"}, "ref": "refs/heads/main"})",
                   "after");
}

static void test_lightweight() {
    Settings s;
    JobRecord rec;
    Outcome o = normalize_payload(PayloadShape::LIGHTWEIGHT, R"({
        "scm": "hg",
        "repositoryUrl": "https://hg.example.com/tool",
        "project": "tools/tool",
        "target": "release",
        "task": "test",
        "commit": "deadbeef",
        "message": "Tag release",
        "viewUrl": "https://hg.example.com/tool/rev/deadbeef",
        "notifications": "none"
    })", s, &rec);
    expect_true(o.ok(), "lightweight should normalize: " + o.detail);
    expect_eq_str(rec.scm, "hg", "scm passed through");
    expect_eq_str(rec.project, "tools/tool", "project");
    expect_eq_str(rec.target, "release", "target");
    expect_eq_str(rec.task, "test", "task");
    expect_eq_str(rec.notifications, "none", "per-request notifications");
    expect_eq_str(rec.view_url, "https://hg.example.com/tool/rev/deadbeef", "view url");
    expect_eq_str(rec.commit_messages["deadbeef"], "Tag release", "message keyed by commit");
}

static void test_lightweight_defaults() {
    Settings s;
    s.notifications = "success";
    JobRecord rec;
    Outcome o = normalize_payload(PayloadShape::LIGHTWEIGHT,
        R"({"scm": "git", "repositoryUrl": "u", "project": "p", "target": "t"})", s, &rec);
    expect_true(o.ok(), "minimal lightweight: " + o.detail);
    expect_eq_str(rec.notifications, "success", "notifications default from settings");
    expect_true(rec.commit.empty() && rec.task.empty() && rec.view_url.empty(), "optional fields empty");
    expect_true(rec.commit_messages.empty(), "no message");
}

static void test_lightweight_missing_fields() {
    expect_missing(PayloadShape::LIGHTWEIGHT, R"({})", "scm");
    expect_missing(PayloadShape::LIGHTWEIGHT, R"({"scm": "git"})", "repositoryUrl");
    expect_missing(PayloadShape::LIGHTWEIGHT, R"({"scm": "git", "repositoryUrl": "u", "target": "t"})", "project");
    expect_missing(PayloadShape::LIGHTWEIGHT, R"({"scm": "git", "repositoryUrl": "u", "project": "p"})", "target");
    expect_missing(PayloadShape::LIGHTWEIGHT,
                   R"({"scm": "git", "repositoryUrl": "u", "project": "p", "target": 5})", "target");
}

static void test_adhoc() {
    Settings s;
    JobRecord rec;
    Outcome o = normalize_payload(PayloadShape::ADHOC, R"({
        "scm": "git", "repositoryUrl": "git@h:org/repo.git", "repositoryName": "org/repo",
        "commit": "cafe", "branch": "dev", "task": "lint"
    })", s, &rec);
    expect_true(o.ok(), "adhoc should normalize: " + o.detail);
    expect_eq_str(rec.project, "org/repo", "repositoryName is the project");
    expect_eq_str(rec.target, "dev", "branch is the target");
    expect_eq_str(rec.commit, "cafe", "commit");
    expect_eq_str(rec.task, "lint", "optional task");
    expect_eq_str(rec.notifications, "all", "notifications from settings");
}

static void test_adhoc_missing_fields() {
    expect_missing(PayloadShape::ADHOC, R"({"repositoryUrl": "u"})", "scm");
    expect_missing(PayloadShape::ADHOC, R"({"scm": "git", "repositoryUrl": "u", "commit": "c", "branch": "b"})",
                   "repositoryName");
    expect_missing(PayloadShape::ADHOC, R"({"scm": "git", "repositoryUrl": "u", "repositoryName": "n", "branch": "b"})",
                   "commit");
    expect_missing(PayloadShape::ADHOC, R"({"scm": "git", "repositoryUrl": "u", "repositoryName": "n", "commit": "c"})",
                   "branch");
}

static void test_malformed_body() {
    Settings s;
    JobRecord rec;
    expect_true(normalize_payload(PayloadShape::ADHOC, "{not json", s, &rec).kind == OutcomeKind::MALFORMED_REQUEST,
                "invalid JSON");
    expect_true(normalize_payload(PayloadShape::ADHOC, "[1,2]", s, &rec).kind == OutcomeKind::MALFORMED_REQUEST,
                "array is not an object");
    expect_true(normalize_payload(PayloadShape::ADHOC, "", s, &rec).kind == OutcomeKind::MALFORMED_REQUEST,
                "empty body");
    expect_true(normalize_payload(PayloadShape::ADHOC, "{} {}", s, &rec).kind == OutcomeKind::MALFORMED_REQUEST,
                "trailing content");

    expect_eq_str(normalize_payload(PayloadShape::ADHOC, "{} {}", s, &rec).detail, "body: trailing content",
                  "parse failure reason kept for the log");
    expect_eq_str(normalize_payload(PayloadShape::ADHOC, "{\"scm\": ", s, &rec).detail, "body: truncated JSON",
                  "cut-off body");
    expect_eq_str(normalize_payload(PayloadShape::ADHOC, "[1,2]", s, &rec).detail, "body is not a JSON object",
                  "wrong top-level type");
}

static void test_doc_handle() {
    json_mini::Doc ok = json_mini::parse("{\"a\": \"b\"}  \n");
    expect_true(static_cast<bool>(ok), "object with trailing whitespace parses");
    expect_true(ok.error.empty(), "no error on success");
    expect_eq_str(json_mini::get_string_or(ok.root, "a", ""), "b", "field readable");

    json_mini::Doc bad = json_mini::parse("{\"a\": }");
    expect_true(!bad && !bad.error.empty(), "syntax error carries a reason");

    json_mini::Doc moved(std::move(bad));
    expect_true(!moved && !moved.error.empty(), "reason survives a move");

    moved = std::move(ok);
    expect_true(static_cast<bool>(moved) && moved.error.empty(), "move assignment takes the document");
    expect_true(!ok, "source released");
}

int main() {
    test_strip_branch_prefix();
    test_gitea_push();
    test_gitea_view_url_fallback();
    test_gitea_missing_fields();
    test_lightweight();
    test_lightweight_defaults();
    test_lightweight_missing_fields();
    test_adhoc();
    test_adhoc_missing_fields();
    test_malformed_body();
    test_doc_handle();
    std::cerr << "test_normalize: ALL PASSED" << std::endl;
    return 0;
}
