#include <strata/source.hpp>
#include <strata/dirs.hpp>
#include <strata/fsutil.hpp>
#include <strata/hash.hpp>
#include <strata/log.hpp>

namespace fs = std::filesystem;

namespace strata {

namespace {

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size()
        && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) {
        s.pop_back();
    }
    return s;
}

// Managed directories never count as part of a local source
std::vector<fs::path> work_areas(const ProjectInfo& info) {
    ProjectDirs d(info.work_dir);
    return {d.parts, d.stage, d.prime, d.overlay, d.state};
}

// Copies a directory from the project, skipping the work areas when the
// source contains them
class LocalSource : public SourceHandler {
public:
    Result<std::string> identity(const Part& part, const ProjectInfo& info) const override {
        fs::path path = local_source_path(part.source, info);
        std::error_code ec;
        if (!fs::is_directory(path, ec)) {
            return StrataError{StrataError::NotFound,
                "local source '" + part.source.location + "' is not a directory",
                "looked in " + path.string()};
        }
        auto digest = hash_tree(path, work_areas(info));
        if (digest.is_err()) return std::move(digest).error();
        return Result<std::string>::ok("local:" + digest.value());
    }

    Result<SourceSnapshot> pull(const Part& part, const ProjectInfo& info,
                                const fs::path& dest, const CancelToken*) const override {
        auto id = identity(part, info);
        if (id.is_err()) return std::move(id).error();
        fs::path path = local_source_path(part.source, info);
        log::debug("copying local source %s to %s", path.c_str(), dest.c_str());
        STRATA_TRY(copy_tree(path, dest, work_areas(info)));

        SourceSnapshot snap;
        snap.identity = std::move(id).value();
        snap.details["path"] = path.string();
        return Result<SourceSnapshot>::ok(std::move(snap));
    }

    bool supports_update() const override { return true; }
};

class GitSource : public SourceHandler {
public:
    Result<std::string> identity(const Part& part, const ProjectInfo&) const override {
        const auto& s = part.source;
        std::string ref = "HEAD";
        if (!s.commit.empty()) {
            ref = s.commit;
        } else if (!s.tag.empty()) {
            ref = "tag:" + s.tag;
        } else if (!s.branch.empty()) {
            ref = "branch:" + s.branch;
        }
        return Result<std::string>::ok("git:" + s.location + "@" + ref);
    }

    Result<SourceSnapshot> pull(const Part& part, const ProjectInfo& info,
                                const fs::path& dest, const CancelToken* cancel) const override {
        const auto& s = part.source;
        CommandOptions opts;
        opts.timeout_seconds = info.step_timeout;
        opts.cancel = cancel;

        std::vector<std::string> clone{"git", "clone"};
        if (!s.tag.empty() || !s.branch.empty()) {
            clone.push_back("--branch");
            clone.push_back(!s.tag.empty() ? s.tag : s.branch);
        }
        if (s.commit.empty()) {
            clone.push_back("--depth");
            clone.push_back("1");
        }
        clone.push_back(s.location);
        clone.push_back(dest.string());

        // git refuses to clone into a non-empty directory
        STRATA_TRY(remove_path(dest));
        log::debug("git clone %s %s", s.location.c_str(), dest.c_str());
        STRATA_TRY(git(clone, opts, "git clone"));

        if (!s.commit.empty()) {
            log::debug("git -C %s checkout %s", dest.c_str(), s.commit.c_str());
            STRATA_TRY(git({"git", "-C", dest.string(), "checkout", s.commit}, opts,
                           "git checkout"));
        }

        auto head = run_command({"git", "-C", dest.string(), "rev-parse", "HEAD"}, opts);
        if (head.is_err()) return std::move(head).error();
        if (head.value().exit_code != 0) {
            return StrataError{StrataError::StepExecution,
                "git rev-parse failed: " + head.value().stderr_str};
        }

        auto id = identity(part, info);
        if (id.is_err()) return std::move(id).error();
        SourceSnapshot snap;
        snap.identity = std::move(id).value();
        snap.details["commit"] = trim(head.value().stdout_str);
        return Result<SourceSnapshot>::ok(std::move(snap));
    }

private:
    static Status git(const std::vector<std::string>& args, const CommandOptions& opts,
                      const std::string& what) {
        auto r = run_command(args, opts);
        if (r.is_err()) return std::move(r).error();
        if (r.value().exit_code != 0) {
            return StrataError{StrataError::StepExecution,
                what + " failed: " + trim(r.value().stderr_str)};
        }
        return ok_status();
    }
};

} // namespace

fs::path local_source_path(const SourceSpec& spec, const ProjectInfo& info) {
    fs::path p = spec.location;
    if (p.is_absolute()) return p.lexically_normal();
    return (info.project_dir / p).lexically_normal();
}

SourceRegistry SourceRegistry::with_builtins() {
    SourceRegistry reg;
    reg.register_handler("local", std::make_shared<LocalSource>());
    reg.register_handler("git", std::make_shared<GitSource>());
    return reg;
}

void SourceRegistry::register_handler(const std::string& type, SourceHandlerPtr handler) {
    handlers_[type] = std::move(handler);
}

Result<std::string> SourceRegistry::source_type(const SourceSpec& spec) {
    if (!spec.type.empty()) return Result<std::string>::ok(spec.type);
    const auto& loc = spec.location;
    if (ends_with(loc, ".git") || starts_with(loc, "git@") || starts_with(loc, "git://")) {
        return Result<std::string>::ok("git");
    }
    if (loc.find("://") != std::string::npos) {
        return StrataError{StrataError::PropertyValidation,
            "cannot determine source type of '" + loc + "'",
            "set the source type explicitly"};
    }
    return Result<std::string>::ok("local");
}

Result<const SourceHandler*> SourceRegistry::resolve(const SourceSpec& spec) const {
    if (spec.empty()) return Result<const SourceHandler*>::ok(nullptr);
    auto type = source_type(spec);
    if (type.is_err()) return std::move(type).error();
    auto it = handlers_.find(type.value());
    if (it == handlers_.end()) {
        return StrataError{StrataError::PropertyValidation,
            "unknown source type '" + type.value() + "'"};
    }
    return Result<const SourceHandler*>::ok(it->second.get());
}

Result<std::string> SourceRegistry::identity(const Part& part, const ProjectInfo& info) const {
    auto handler = resolve(part.source);
    if (handler.is_err()) return std::move(handler).error();
    if (!handler.value()) return Result<std::string>::ok("none");
    return handler.value()->identity(part, info);
}

} // namespace strata
