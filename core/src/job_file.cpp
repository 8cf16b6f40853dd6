#include "mixmaster/job_file.h"
#include "mixmaster/ini.h"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <string>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace mixmaster {

std::string job_file_stem(std::time_t t) {
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), "%Y%m%d-%H%M%S", &tm);
    return std::string(buf, n);
}

std::string encode_job_file(const ResolvedJob& job, const Settings& settings) {
    const JobRecord& r = job.record;
    IniDocument doc;
    IniSection& s = doc.section(kJobGroup);
    auto put = [&s](const char* key, const std::string& value) {
        s.entries.emplace_back(key, ini_escape(value));
    };
    put("scm", r.scm);
    put("project", r.project);
    put("repositoryUrl", r.repository_url);
    put("commit", r.commit);
    put("task", r.task);
    put("target", job.matched_target_key);
    put("buildCommand", job.build_command);
    put("viewUrl", r.view_url);
    put("mailto", settings.mailto);
    put("mode", mode_name(settings.mode));
    put("notifications", r.notifications);
    for (const auto& kv : r.commit_messages) {
        s.entries.emplace_back(kMessageKeyPrefix + ini_escape(kv.first), ini_escape(kv.second));
    }
    return ini_write(doc);
}

bool decode_job_file(const std::string& text, JobFile* out, std::string* err) {
    IniDocument doc;
    if (!ini_parse(text, &doc, err)) return false;
    const IniSection* s = doc.find(kJobGroup);
    if (!s) {
        if (err) *err = std::string("missing [") + kJobGroup + "] group";
        return false;
    }

    JobFile jf;
    JobRecord& r = jf.job.record;
    const std::string prefix = kMessageKeyPrefix;
    for (const auto& kv : s->entries) {
        const std::string key = ini_unescape(kv.first);
        const std::string value = ini_unescape(kv.second);
        if (key.compare(0, prefix.size(), prefix) == 0) {
            r.commit_messages[key.substr(prefix.size())] = value;
        } else if (key == "scm") {
            r.scm = value;
        } else if (key == "project") {
            r.project = value;
        } else if (key == "repositoryUrl") {
            r.repository_url = value;
        } else if (key == "commit") {
            r.commit = value;
        } else if (key == "task") {
            r.task = value;
        } else if (key == "target") {
            r.target = value;
            jf.job.matched_target_key = value;
        } else if (key == "buildCommand") {
            jf.job.build_command = value;
        } else if (key == "viewUrl") {
            r.view_url = value;
        } else if (key == "mailto") {
            jf.mailto = value;
        } else if (key == "mode") {
            jf.mode = value;
        } else if (key == "notifications") {
            r.notifications = value;
        }
    }

    if (out) *out = std::move(jf);
    return true;
}

static std::string errno_text(const char* what, const std::filesystem::path& p) {
    return std::string(what) + " " + p.string() + ": " + std::strerror(errno);
}

static std::string write_all(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::string("write: ") + std::strerror(errno);
        }
        off += static_cast<size_t>(n);
    }
    return "";
}

Outcome write_job_file(const ResolvedJob& job, const Settings& settings,
                       std::time_t now, std::filesystem::path* written) {
    const std::filesystem::path dir = settings.spool;
    const std::string stem = job_file_stem(now);
    const std::filesystem::path tmp = dir / ("." + stem + "." + std::to_string(::getpid()) + ".tmp");
    const std::string text = encode_job_file(job, settings);

    int fd = ::open(tmp.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Outcome::fail(OutcomeKind::WRITE_FAILURE, errno_text("open", tmp));
    }
    std::string err = write_all(fd, text);
    if (err.empty() && ::fsync(fd) != 0) err = errno_text("fsync", tmp);
    if (::close(fd) != 0 && err.empty()) err = errno_text("close", tmp);
    if (!err.empty()) {
        ::unlink(tmp.c_str());
        return Outcome::fail(OutcomeKind::WRITE_FAILURE, err);
    }

    for (int attempt = 0; attempt <= kMaxNameCollisions; attempt++) {
        std::string name = stem;
        if (attempt > 0) name += "-" + std::to_string(attempt);
        name += kJobFileExtension;
        const std::filesystem::path dst = dir / name;
        if (::link(tmp.c_str(), dst.c_str()) == 0) {
            ::unlink(tmp.c_str());
            if (written) *written = dst;
            return Outcome::success();
        }
        if (errno != EEXIST) {
            err = errno_text("link", dst);
            break;
        }
    }
    if (err.empty()) err = "no free job file name for " + stem;
    ::unlink(tmp.c_str());
    return Outcome::fail(OutcomeKind::WRITE_FAILURE, err);
}

} // namespace mixmaster
