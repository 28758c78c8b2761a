#pragma once

#include "mdclone/clone_pipeline.h"

#include <filesystem>
#include <string>

namespace mdclone {

// JSON summary of one run, for scripts that drive the tool.
bool write_run_report(const std::filesystem::path& path,
                      const CloneResult& result,
                      const RepoLayout& layout,
                      std::string& error);

} // namespace mdclone
