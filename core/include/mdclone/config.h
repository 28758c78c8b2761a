#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace mdclone {

struct SchemaOptions {
  std::map<std::string, std::string> namespaces = {
      {"xr", "http://v8.1c.ru/8.3/xcf/readable"},
  };
  std::string identity_attribute = "uuid";
  std::string type_id_query = "//xr:TypeId";
  std::string value_id_query = "//xr:ValueId";
  // Per-object identifiers held in element text. Unlike the two roles above
  // these may match nothing. Class constants such as xr:ClassId stay out.
  std::vector<std::string> extra_id_queries = {"//xr:ObjectId"};
  bool regenerate_nested_uuids = true;
  bool write_bom = false;
};

struct IndexOptions {
  std::string structural_file = "Configuration.xml";
  std::string structural_collection = "ChildObjects";
  std::string dump_file = "ConfigDumpInfo.xml";
  std::string dump_collection = "ConfigVersions";
  std::string dump_record = "Metadata";
  // "text", "attribute:<name>" or "child:<name>".
  std::string dump_name = "text";
  // Empty, "attribute:<name>" or "child:<name>".
  std::string dump_id;
};

struct CloneConfig {
  std::string root;
  std::string type;
  std::string donor;
  std::string clone;
  std::string type_group;
  SchemaOptions schema;
  IndexOptions indexes;
};

CloneConfig load_clone_config(const std::filesystem::path& path);

} // namespace mdclone
