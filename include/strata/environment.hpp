#pragma once

#include <strata/config.hpp>
#include <strata/part.hpp>
#include <strata/plugin.hpp>
#include <strata/step.hpp>
#include <filesystem>
#include <string>

namespace strata {

// Quote for a POSIX shell word: 'it'"'"'s'
std::string shell_quote(const std::string& s);

// Variables exported to a step's scripts, in export order: the standard
// STRATA_* set and search paths, then the plugin environment (build only),
// then the part's build_environment. Later entries may refer to earlier ones.
EnvironmentList step_environment(const Part& part,
                                 Step step,
                                 const PluginContext& ctx,
                                 const ProjectInfo& info,
                                 const Plugin* plugin,
                                 const std::filesystem::path& overlay_view = {});

// Shell prologue exporting `env`. Values are double-quoted so that
// "${STRATA_STAGE}"-style references expand.
std::string environment_script(const EnvironmentList& env);

} // namespace strata
