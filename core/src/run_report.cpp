#include "mdclone/run_report.h"

#include <fstream>
#include <system_error>

#if MDCLONE_ENABLE_DATA_JSON
#include <nlohmann/json.hpp>
#endif

namespace mdclone {

bool write_run_report(const std::filesystem::path& path,
                      const CloneResult& result,
                      const RepoLayout& layout,
                      std::string& error) {
#if MDCLONE_ENABLE_DATA_JSON
  nlohmann::json j;
  j["success"] = result.success;
  j["error_code"] = error_code(result.error.kind);
  j["error_message"] = result.error.message;
  j["error_path"] = result.error.path.string();
  j["root"] = layout.root.string();
  j["clone_path"] = result.clone_path.string();
  j["removed_clone_file"] = result.removed_clone_file;
  j["removed_records"] = result.removed_records;
  j["rewrites"] = {{"path_suffixes", result.rewrites.path_suffixes},
                   {"text_values", result.rewrites.text_values}};
  j["regenerated_ids"] = result.identities.total();
  j["identities"] = {{"root", result.identities.root_ids},
                     {"type_id", result.identities.type_ids},
                     {"value_id", result.identities.value_ids},
                     {"extra", result.identities.extra_ids},
                     {"nested", result.identities.nested_ids}};
  j["structural_placement"] = index::placement_name(result.structural_placement);
  j["dump_placement"] = index::placement_name(result.dump_placement);

  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    error = "cannot open report file " + path.string();
    return false;
  }
  out << j.dump(2) << "\n";
  if (!out) {
    error = "failed to write report file " + path.string();
    return false;
  }
  return true;
#else
  (void)path;
  (void)result;
  (void)layout;
  error = "json_disabled";
  return false;
#endif
}

} // namespace mdclone
