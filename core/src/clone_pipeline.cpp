#include "mdclone/clone_pipeline.h"

#include "mdclone/log.h"

#include <system_error>
#include <utility>

namespace mdclone {
namespace fs = std::filesystem;

namespace {
bool is_file(const fs::path& path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec);
}

bool has_path_separator(const std::string& name) {
  return name.find('/') != std::string::npos || name.find('\\') != std::string::npos;
}
} // namespace

ClonePipeline::ClonePipeline(CloneConfig config, IdSource& ids)
    : config_(std::move(config)), ids_(ids) {
  const auto root = resolve_repo_root(config_.root.empty()
                                          ? std::optional<fs::path>()
                                          : std::optional<fs::path>(fs::path(config_.root)));
  layout_ = resolve_layout(root, config_.type, config_.donor, config_.clone, config_.type_group,
                           config_.indexes.structural_file, config_.indexes.dump_file);
  donor_ = EntityRef{config_.type, config_.donor};
  clone_ = EntityRef{config_.type, config_.clone};

  structural_ = index::structural_schema(config_.indexes.structural_collection);

  index::FieldSpec name_field;
  std::optional<index::FieldSpec> id_field;
  if (!index::parse_field_spec(config_.indexes.dump_name, name_field, schema_error_)) {
    schema_error_ = "indexes.dump_name: " + schema_error_;
  } else if (!config_.indexes.dump_id.empty()) {
    index::FieldSpec spec;
    if (!index::parse_field_spec(config_.indexes.dump_id, spec, schema_error_)) {
      schema_error_ = "indexes.dump_id: " + schema_error_;
    } else {
      id_field = spec;
    }
  }
  dump_ = index::dump_schema(config_.indexes.dump_collection, config_.indexes.dump_record,
                             name_field, id_field);
}

CloneResult ClonePipeline::run() {
  CloneResult result;
  result.clone_path = layout_.clone_path;
  log::info("clone " + donor_.qualified_name() + " -> " + clone_.qualified_name() + " in " +
            layout_.root.string());

  if (!validate_request(result, true) || !check_inputs(result, true) || !cleanup(result) ||
      !duplicate(result) || !regenerate(result) || !integrate(result)) {
    log::error(result.error.describe());
    return result;
  }

  result.success = true;
  log::info("clone complete: " + clone_.qualified_name());
  return result;
}

CloneResult ClonePipeline::remove_traces() {
  CloneResult result;
  result.clone_path = layout_.clone_path;
  log::info("remove " + clone_.qualified_name() + " from " + layout_.root.string());

  if (!validate_request(result, false) || !check_inputs(result, false) || !cleanup(result)) {
    log::error(result.error.describe());
    return result;
  }
  result.success = true;
  return result;
}

bool ClonePipeline::validate_request(CloneResult& result, bool need_donor) {
  if (config_.type.empty() || config_.clone.empty()) {
    return fail(result.error, ErrorKind::invalid_request, "type and clone must be set");
  }
  if (need_donor && config_.donor.empty()) {
    return fail(result.error, ErrorKind::invalid_request, "donor must be set");
  }
  if (config_.donor == config_.clone) {
    return fail(result.error, ErrorKind::invalid_request,
                "clone name equals donor name '" + config_.donor + "'");
  }
  if (has_path_separator(config_.type) || has_path_separator(config_.donor) ||
      has_path_separator(config_.clone)) {
    return fail(result.error, ErrorKind::invalid_request, "entity names must not contain paths");
  }
  if (!schema_error_.empty()) {
    return fail(result.error, ErrorKind::invalid_request, schema_error_);
  }
  return true;
}

bool ClonePipeline::check_inputs(CloneResult& result, bool need_donor) {
  if (need_donor && !is_file(layout_.donor_path)) {
    return fail(result.error, ErrorKind::artifact_not_found,
                "donor " + donor_.qualified_name() + " not found", layout_.donor_path);
  }
  for (const auto* path : {&layout_.structural_index, &layout_.dump_index}) {
    if (!is_file(*path)) {
      return fail(result.error, ErrorKind::artifact_not_found, "index file not found", *path);
    }
  }
  return true;
}

bool ClonePipeline::cleanup(CloneResult& result) {
  log::info("cleanup: removing traces of " + clone_.qualified_name());
  if (!xml::delete_if_exists(layout_.clone_path, result.removed_clone_file, result.error)) {
    return false;
  }
  if (result.removed_clone_file) {
    log::info("removed old file: " + layout_.clone_path.string());
  }
  return remove_from_index(layout_.structural_index, structural_, result) &&
         remove_from_index(layout_.dump_index, dump_, result);
}

bool ClonePipeline::remove_from_index(const fs::path& path,
                                      const index::IndexSchema& schema,
                                      CloneResult& result) {
  xml::Document doc;
  if (!xml::load(path, doc, result.error)) {
    return false;
  }
  if (!index::record_collection(doc, schema)) {
    return fail(result.error, ErrorKind::malformed_artifact,
                "record collection '" + schema.collection + "' not found", path);
  }
  const auto records = index::find_records(doc, schema, clone_.qualified_name());
  if (records.empty()) {
    return true;
  }
  for (xmlNode* record : records) {
    index::remove_record(record);
  }
  if (!xml::save(doc, path, xml::SaveOptions{config_.schema.write_bom}, result.error)) {
    return false;
  }
  result.removed_records += records.size();
  log::info("removed " + std::to_string(records.size()) + " " + schema.label + " record(s) for " +
            clone_.qualified_name() + " from " + path.filename().string());
  return true;
}

bool ClonePipeline::duplicate(CloneResult& result) {
  log::info("duplicate: " + layout_.donor_path.string());
  std::string text;
  if (!xml::read_text(layout_.donor_path, text, result.error)) {
    return false;
  }
  rewritten_text_ = rewrite_qualified_names(text, donor_.name, clone_.name, &result.rewrites);
  log::info("rewrote " + std::to_string(result.rewrites.path_suffixes) + " path suffix(es) and " +
            std::to_string(result.rewrites.text_values) + " text value(s)");
  return true;
}

bool ClonePipeline::regenerate(CloneResult& result) {
  log::info("regenerate identifiers");
  if (!xml::parse(rewritten_text_, layout_.clone_path, clone_doc_, result.error)) {
    return false;
  }
  if (!regenerate_identifiers(clone_doc_, config_.schema, ids_, result.identities, result.error)) {
    return false;
  }
  if (!xml::save(clone_doc_, layout_.clone_path, xml::SaveOptions{config_.schema.write_bom},
                 result.error)) {
    return false;
  }
  rewritten_text_.clear();
  log::info("regenerated " + std::to_string(result.identities.total()) + " identifier(s); saved " +
            layout_.clone_path.string());
  return true;
}

bool ClonePipeline::integrate(CloneResult& result) {
  log::info("integrate: registering " + clone_.qualified_name());
  return insert_into_index(layout_.structural_index, structural_, result.structural_placement,
                           result) &&
         insert_into_index(layout_.dump_index, dump_, result.dump_placement, result);
}

bool ClonePipeline::insert_into_index(const fs::path& path,
                                      const index::IndexSchema& schema,
                                      index::Placement& placement,
                                      CloneResult& result) {
  xml::Document doc;
  if (!xml::load(path, doc, result.error)) {
    return false;
  }
  const auto inserted =
      index::insert_after_last_of_type(doc, schema, clone_.type, clone_.qualified_name(), ids_);
  if (!inserted.record) {
    return fail(result.error, ErrorKind::malformed_artifact,
                "record collection '" + schema.collection + "' not found", path);
  }
  if (!xml::save(doc, path, xml::SaveOptions{config_.schema.write_bom}, result.error)) {
    return false;
  }
  placement = inserted.placement;
  if (placement == index::Placement::appended) {
    log::warn("no " + clone_.type + " record in " + path.filename().string() +
              "; appended at the end of the record collection");
  } else {
    log::info("inserted after last " + clone_.type + " record in " + path.filename().string());
  }
  return true;
}

} // namespace mdclone
