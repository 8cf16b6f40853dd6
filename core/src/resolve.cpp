#include "mixmaster/resolve.h"

#include <utility>
#include <vector>

namespace mixmaster {

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

Outcome match_target(const TargetTable& targets,
                     const std::string& target,
                     const std::string& task,
                     std::string* matched_key,
                     std::string* command) {
    std::vector<TargetTable::const_iterator> candidates;
    for (auto it = targets.begin(); it != targets.end(); ++it) {
        if (starts_with(it->first, target)) candidates.push_back(it);
    }
    if (candidates.empty()) {
        return Outcome::fail(OutcomeKind::UNKNOWN_TARGET, target);
    }

    if (!task.empty()) {
        const std::string narrowed = target + "/" + task;
        std::vector<TargetTable::const_iterator> kept;
        for (auto it : candidates) {
            if (starts_with(it->first, narrowed)) kept.push_back(it);
        }
        if (kept.empty()) {
            return Outcome::fail(OutcomeKind::UNKNOWN_TASK, narrowed);
        }
        candidates.swap(kept);
    }

    if (candidates.size() > 1) {
        Outcome o = Outcome::fail(OutcomeKind::AMBIGUOUS_TARGET,
                                  task.empty() ? target : target + "/" + task);
        for (auto it : candidates) o.candidates.push_back(it->first);
        return o;
    }

    if (matched_key) *matched_key = candidates.front()->first;
    if (command) *command = candidates.front()->second;
    return Outcome::success();
}

Outcome resolve_target(const Config& cfg, const JobRecord& rec, ResolvedJob* out) {
    const TargetTable* targets = cfg.targets_for(rec.project);
    if (!targets) {
        return Outcome::fail(OutcomeKind::UNKNOWN_PROJECT, rec.project);
    }

    ResolvedJob job;
    Outcome o = match_target(*targets, rec.target, rec.task, &job.matched_target_key, &job.build_command);
    if (!o.ok()) return o;

    job.record = rec;
    if (out) *out = std::move(job);
    return Outcome::success();
}

} // namespace mixmaster
