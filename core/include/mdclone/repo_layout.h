#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace mdclone {

struct EntityRef {
  std::string type;
  std::string name;

  std::string qualified_name() const { return type + "." + name; }
};

struct RepoLayout {
  std::filesystem::path root;
  std::filesystem::path type_dir;
  std::filesystem::path donor_path;
  std::filesystem::path clone_path;
  std::filesystem::path structural_index;
  std::filesystem::path dump_index;
};

// Directory that holds definition files of `type`, e.g. Catalog -> Catalogs.
std::string type_group_for(const std::string& type);

// Explicit root, then MDCLONE_ROOT, then the working directory. A
// `Configuration` subdirectory, when present, becomes the effective root.
std::filesystem::path resolve_repo_root(const std::optional<std::filesystem::path>& root_override);

RepoLayout resolve_layout(const std::filesystem::path& root,
                          const std::string& type,
                          const std::string& donor_name,
                          const std::string& clone_name,
                          const std::string& type_group_override,
                          const std::string& structural_file,
                          const std::string& dump_file);

} // namespace mdclone
