#include "mdclone/repo_layout.h"

#include "mdclone/log.h"

#include <cstdlib>
#include <system_error>
#include <unordered_map>

namespace mdclone {

namespace {
const std::unordered_map<std::string, std::string>& irregular_groups() {
  static const std::unordered_map<std::string, std::string> groups = {
      {"BusinessProcess", "BusinessProcesses"},
      {"ChartOfAccounts", "ChartsOfAccounts"},
      {"ChartOfCalculationTypes", "ChartsOfCalculationTypes"},
      {"ChartOfCharacteristicTypes", "ChartsOfCharacteristicTypes"},
      {"FilterCriterion", "FilterCriteria"},
      {"SettingsStorage", "SettingsStorages"},
  };
  return groups;
}

bool dir_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::is_directory(path, ec);
}
} // namespace

std::string type_group_for(const std::string& type) {
  const auto& groups = irregular_groups();
  auto it = groups.find(type);
  if (it != groups.end()) {
    return it->second;
  }
  if (type.empty()) {
    return type;
  }
  return type + "s";
}

std::filesystem::path resolve_repo_root(const std::optional<std::filesystem::path>& root_override) {
  std::filesystem::path root;
  if (root_override.has_value() && !root_override->empty()) {
    root = root_override.value();
  } else if (const char* env_root = std::getenv("MDCLONE_ROOT")) {
    root = std::filesystem::path(env_root);
  } else {
    root = std::filesystem::current_path();
  }

  const std::filesystem::path nested = root / "Configuration";
  if (dir_exists(nested)) {
    return nested;
  }
  if (!dir_exists(root)) {
    log::warn(std::string("repository root not found: ") + root.string());
  }
  return root;
}

RepoLayout resolve_layout(const std::filesystem::path& root,
                          const std::string& type,
                          const std::string& donor_name,
                          const std::string& clone_name,
                          const std::string& type_group_override,
                          const std::string& structural_file,
                          const std::string& dump_file) {
  RepoLayout out;
  out.root = root;
  out.type_dir = root / (type_group_override.empty() ? type_group_for(type) : type_group_override);
  out.donor_path = out.type_dir / (donor_name + ".xml");
  out.clone_path = out.type_dir / (clone_name + ".xml");
  out.structural_index = root / structural_file;
  out.dump_index = root / dump_file;
  return out;
}

} // namespace mdclone
