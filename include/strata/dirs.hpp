#pragma once

#include <filesystem>
#include <string>

namespace strata {

// Shared areas under the work directory
struct ProjectDirs {
    std::filesystem::path work;
    std::filesystem::path parts;
    std::filesystem::path stage;
    std::filesystem::path prime;
    std::filesystem::path overlay;
    std::filesystem::path state;

    explicit ProjectDirs(const std::filesystem::path& work_dir);
};

// Per-part directories under <work>/parts/<name>
struct PartDirs {
    std::filesystem::path root;
    std::filesystem::path src;
    std::filesystem::path src_work;    // src/<source-subdir>
    std::filesystem::path build;
    std::filesystem::path build_work;  // build/<source-subdir>
    std::filesystem::path install;
    std::filesystem::path run;
    std::filesystem::path layer;

    PartDirs(const ProjectDirs& project, const std::string& part_name,
             const std::string& source_subdir = "");
};

} // namespace strata
