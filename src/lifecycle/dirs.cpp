#include <strata/dirs.hpp>

namespace fs = std::filesystem;

namespace strata {

ProjectDirs::ProjectDirs(const fs::path& work_dir)
    : work(work_dir),
      parts(work_dir / "parts"),
      stage(work_dir / "stage"),
      prime(work_dir / "prime"),
      overlay(work_dir / "overlay"),
      state(work_dir / "state") {}

PartDirs::PartDirs(const ProjectDirs& project, const std::string& part_name,
                   const std::string& source_subdir)
    : root(project.parts / part_name),
      src(root / "src"),
      src_work(source_subdir.empty() ? src : src / source_subdir),
      build(root / "build"),
      build_work(source_subdir.empty() ? build : build / source_subdir),
      install(root / "install"),
      run(root / "run"),
      layer(root / "layer") {}

} // namespace strata
