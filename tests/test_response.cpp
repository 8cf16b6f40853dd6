#include "test_common.h"
#include "mixmaster/response.h"

#include <sstream>
#include <string>

using namespace mixmaster;

static void test_status_mapping() {
    expect_eq_ll(status_for(OutcomeKind::OK), 204, "accepted job");
    expect_eq_ll(status_for(OutcomeKind::MALFORMED_REQUEST), 400, "malformed");
    expect_eq_ll(status_for(OutcomeKind::NOT_FOUND), 404, "unknown path");
    expect_eq_ll(status_for(OutcomeKind::METHOD_NOT_ALLOWED), 405, "wrong method");
    expect_eq_ll(status_for(OutcomeKind::VALIDATION_ERROR), 422, "validation");
    expect_eq_ll(status_for(OutcomeKind::UNKNOWN_PROJECT), 422, "unknown project");
    expect_eq_ll(status_for(OutcomeKind::UNKNOWN_TARGET), 422, "unknown target");
    expect_eq_ll(status_for(OutcomeKind::UNKNOWN_TASK), 422, "unknown task");
    expect_eq_ll(status_for(OutcomeKind::AMBIGUOUS_TARGET), 422, "ambiguous");
    expect_eq_ll(status_for(OutcomeKind::WRITE_FAILURE), 500, "write failure");
    expect_eq_ll(status_for(OutcomeKind::CONFIG_MISSING), 503, "config missing");
    expect_eq_ll(status_for(OutcomeKind::CONFIG_INVALID), 503, "config invalid");
}

static void test_success_is_bare_204() {
    const std::string wire = format_response(response_for(Outcome::success()));
    expect_eq_str(wire, "HTTP/1.1 204 No Content\r\nConnection: close\r\n\r\n", "204 wire form");
}

static void test_validation_body() {
    Response r = response_for(Outcome::fail(OutcomeKind::VALIDATION_ERROR, "target"));
    expect_eq_ll(r.status, 422, "status");
    expect_eq_str(r.body, "Missing required field: target\n", "human-readable body");

    const std::string wire = format_response(r);
    expect_true(wire.rfind("HTTP/1.1 422 Unprocessable Entity\r\n", 0) == 0, "status line");
    expect_true(wire.find("Content-Type: text/plain; charset=utf-8\r\n") != std::string::npos, "content type");
    expect_true(wire.find("Content-Length: 31\r\n") != std::string::npos, "content length: " + wire);
    expect_true(wire.size() >= r.body.size() &&
                wire.compare(wire.size() - r.body.size(), r.body.size(), r.body) == 0, "body last");
}

static void test_infrastructure_failures_have_no_detail() {
    Response r = response_for(Outcome::fail(OutcomeKind::WRITE_FAILURE, "open /var/spool/x: Permission denied"));
    expect_eq_ll(r.status, 500, "status");
    expect_true(r.body.empty(), "filesystem detail is not leaked to the client");
    expect_true(format_response(r).find("Content-Length: 0\r\n") != std::string::npos, "explicit empty length");

    r = response_for(Outcome::fail(OutcomeKind::CONFIG_MISSING, "/etc/mixmaster.ini"));
    expect_eq_ll(r.status, 503, "config status");
    expect_true(r.body.empty(), "config path is not leaked");

    r = response_for(Outcome::fail(OutcomeKind::MALFORMED_REQUEST, "bad content-length"));
    expect_true(r.body.empty(), "malformed has no body");
}

static void test_method_not_allowed_header() {
    Response r = response_for(Outcome::fail(OutcomeKind::METHOD_NOT_ALLOWED, "POST, PUT"));
    expect_eq_ll(r.status, 405, "status");
    expect_true(format_response(r).find("Allow: POST, PUT\r\n") != std::string::npos, "Allow header");
}

static void test_version() {
    Response r = version_response();
    expect_eq_ll(r.status, 200, "version status");
    expect_eq_str(r.body, std::string(MIXMASTER_VERSION) + "\n", "version body");
}

static void test_head_only_keeps_length() {
    Response r = version_response();
    r.head_only = true;
    const std::string wire = format_response(r);
    const std::string length = "Content-Length: " + std::to_string(r.body.size()) + "\r\n";
    expect_true(wire.find(length) != std::string::npos, "length of the GET body: " + wire);
    expect_true(wire.size() >= 4 && wire.compare(wire.size() - 4, 4, "\r\n\r\n") == 0, "ends after the headers");
    expect_true(wire.find(MIXMASTER_VERSION) == std::string::npos, "no body bytes");
}

static void test_write_response() {
    std::ostringstream out;
    expect_true(write_response(out, version_response()), "write to good stream");
    expect_true(out.str().rfind("HTTP/1.1 200 OK\r\n", 0) == 0, "written status line");

    std::ostringstream bad;
    bad.setstate(std::ios::badbit);
    expect_true(!write_response(bad, version_response()), "failed stream reported");
}

int main() {
    test_status_mapping();
    test_success_is_bare_204();
    test_validation_body();
    test_infrastructure_failures_have_no_detail();
    test_method_not_allowed_header();
    test_version();
    test_head_only_keeps_length();
    test_write_response();
    std::cerr << "test_response: ALL PASSED" << std::endl;
    return 0;
}
