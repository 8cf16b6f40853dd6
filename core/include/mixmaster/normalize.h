#pragma once
#include "config.h"
#include "route.h"
#include "types.h"

#include <json-c/json.h>

#include <string>

namespace mixmaster {

// Converts one decoded body into a JobRecord.
// VALIDATION_ERROR names the first missing field; fields are checked in
// the order listed for each shape below. The fields that become project
// and target must also be non-empty.
using NormalizeFn = Outcome (*)(json_object* body, const Settings& settings, JobRecord* out);

// repository, repository.ssh_url, repository.full_name, ref, after
Outcome normalize_gitea(json_object* body, const Settings& settings, JobRecord* out);

// scm, repositoryUrl, project, target
Outcome normalize_lightweight(json_object* body, const Settings& settings, JobRecord* out);

// scm, repositoryUrl, repositoryName, commit, branch
Outcome normalize_adhoc(json_object* body, const Settings& settings, JobRecord* out);

NormalizeFn normalizer_for(PayloadShape shape);

// Removes the first "refs/heads/" occurrence, if any.
std::string strip_branch_prefix(const std::string& ref);

// Decodes body (MALFORMED_REQUEST unless it is a JSON object) and runs
// the shape's normalizer.
Outcome normalize_payload(PayloadShape shape, const std::string& body,
                          const Settings& settings, JobRecord* out);

} // namespace mixmaster
