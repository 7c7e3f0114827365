#pragma once

#include <strata/config.hpp>
#include <strata/part.hpp>
#include <strata/process.hpp>
#include <strata/result.hpp>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

namespace strata {

// What a pull produced
struct SourceSnapshot {
    std::string identity;
    std::map<std::string, std::string> details;   // e.g. "commit" for git
};

// Fetches a part's sources into its src directory
class SourceHandler {
public:
    virtual ~SourceHandler() = default;

    // Cheap plan-time identity; changes whenever a pull would fetch
    // something different
    virtual Result<std::string> identity(const Part& part, const ProjectInfo& info) const = 0;

    virtual Result<SourceSnapshot> pull(const Part& part,
                                        const ProjectInfo& info,
                                        const std::filesystem::path& dest,
                                        const CancelToken* cancel) const = 0;

    // True when pulling into an existing src tree refreshes it in place
    virtual bool supports_update() const { return false; }
};

using SourceHandlerPtr = std::shared_ptr<const SourceHandler>;

class SourceRegistry {
public:
    // Registry with "local" and "git"
    static SourceRegistry with_builtins();

    void register_handler(const std::string& type, SourceHandlerPtr handler);

    // Explicit type, or detected from the location
    static Result<std::string> source_type(const SourceSpec& spec);

    // nullptr for parts without a source
    Result<const SourceHandler*> resolve(const SourceSpec& spec) const;

    // "none" for parts without a source
    Result<std::string> identity(const Part& part, const ProjectInfo& info) const;

private:
    std::map<std::string, SourceHandlerPtr> handlers_;
};

// Directory of a local source, relative locations resolved against the project
std::filesystem::path local_source_path(const SourceSpec& spec, const ProjectInfo& info);

} // namespace strata
