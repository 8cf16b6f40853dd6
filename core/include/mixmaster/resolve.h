#pragma once
#include "config.h"
#include "types.h"

#include <string>

namespace mixmaster {

// Prefix match of a requested target (and optional task) against one
// project's targets. A configured key is a candidate when it starts with
// target; a non-empty task narrows candidates to keys starting with
// "{target}/{task}". More than one survivor is AMBIGUOUS_TARGET, never a
// "best" pick.
Outcome match_target(const TargetTable& targets,
                     const std::string& target,
                     const std::string& task,
                     std::string* matched_key,
                     std::string* command);

// Looks up rec.project (UNKNOWN_PROJECT if absent) and runs match_target.
Outcome resolve_target(const Config& cfg, const JobRecord& rec, ResolvedJob* out);

} // namespace mixmaster
