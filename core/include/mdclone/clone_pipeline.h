#pragma once

#include "mdclone/config.h"
#include "mdclone/errors.h"
#include "mdclone/id_source.h"
#include "mdclone/identity.h"
#include "mdclone/index_editor.h"
#include "mdclone/name_rewrite.h"
#include "mdclone/repo_layout.h"
#include "mdclone/xml_store.h"

#include <filesystem>
#include <string>

namespace mdclone {

struct CloneResult {
  bool success = false;
  Error error;
  std::filesystem::path clone_path;
  bool removed_clone_file = false;
  size_t removed_records = 0;
  RewriteStats rewrites;
  IdentityStats identities;
  index::Placement structural_placement = index::Placement::none;
  index::Placement dump_placement = index::Placement::none;
};

// One clone-and-integrate run over a repository. Holds the resolved paths,
// index schemas and the in-flight clone document between phases.
class ClonePipeline {
 public:
  ClonePipeline(CloneConfig config, IdSource& ids);

  // Preflight, cleanup, duplication, identifier regeneration, integration.
  CloneResult run();
  // Preflight of the clone side and cleanup only.
  CloneResult remove_traces();

  const RepoLayout& layout() const { return layout_; }
  const CloneConfig& config() const { return config_; }
  const index::IndexSchema& structural_schema() const { return structural_; }
  const index::IndexSchema& dump_schema() const { return dump_; }

 private:
  bool validate_request(CloneResult& result, bool need_donor);
  bool check_inputs(CloneResult& result, bool need_donor);
  bool cleanup(CloneResult& result);
  bool duplicate(CloneResult& result);
  bool regenerate(CloneResult& result);
  bool integrate(CloneResult& result);

  bool remove_from_index(const std::filesystem::path& path,
                         const index::IndexSchema& schema,
                         CloneResult& result);
  bool insert_into_index(const std::filesystem::path& path,
                         const index::IndexSchema& schema,
                         index::Placement& placement,
                         CloneResult& result);

  CloneConfig config_;
  IdSource& ids_;
  RepoLayout layout_;
  EntityRef donor_;
  EntityRef clone_;
  index::IndexSchema structural_;
  index::IndexSchema dump_;
  std::string schema_error_;
  std::string rewritten_text_;
  xml::Document clone_doc_;
};

} // namespace mdclone
