#include "mdclone/config.h"

#include "mdclone/log.h"

#include <fstream>
#include <optional>

#if MDCLONE_ENABLE_DATA_JSON
#include <nlohmann/json.hpp>
#endif

#if MDCLONE_ENABLE_DATA_YAML
#include <yaml-cpp/yaml.h>
#endif

namespace mdclone {

namespace {
bool file_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

void apply_string(std::string& dst, const std::string& value) {
  if (!value.empty()) dst = value;
}

#if MDCLONE_ENABLE_DATA_JSON
std::string json_string(const nlohmann::json& node, const char* key) {
  if (node.contains(key) && node[key].is_string()) {
    return node[key].get<std::string>();
  }
  return {};
}

void read_json(const nlohmann::json& j, CloneConfig& cfg) {
  const auto& root = j.contains("clone") && j["clone"].is_object() ? j["clone"] : j;

  apply_string(cfg.root, json_string(root, "root"));
  apply_string(cfg.type, json_string(root, "type"));
  apply_string(cfg.donor, json_string(root, "donor"));
  apply_string(cfg.clone, json_string(root, "clone"));
  apply_string(cfg.type_group, json_string(root, "type_group"));

  if (root.contains("schema") && root["schema"].is_object()) {
    const auto& schema = root["schema"];
    if (schema.contains("namespaces") && schema["namespaces"].is_object()) {
      cfg.schema.namespaces.clear();
      for (const auto& [prefix, uri] : schema["namespaces"].items()) {
        cfg.schema.namespaces[prefix] = uri.get<std::string>();
      }
    }
    apply_string(cfg.schema.identity_attribute, json_string(schema, "identity_attribute"));
    apply_string(cfg.schema.type_id_query, json_string(schema, "type_id_query"));
    apply_string(cfg.schema.value_id_query, json_string(schema, "value_id_query"));
    if (schema.contains("extra_id_queries") && schema["extra_id_queries"].is_array()) {
      cfg.schema.extra_id_queries.clear();
      for (const auto& query : schema["extra_id_queries"]) {
        cfg.schema.extra_id_queries.push_back(query.get<std::string>());
      }
    }
    if (schema.contains("regenerate_nested_uuids")) {
      cfg.schema.regenerate_nested_uuids = schema["regenerate_nested_uuids"].get<bool>();
    }
    if (schema.contains("write_bom")) {
      cfg.schema.write_bom = schema["write_bom"].get<bool>();
    }
  }

  if (root.contains("indexes") && root["indexes"].is_object()) {
    const auto& idx = root["indexes"];
    apply_string(cfg.indexes.structural_file, json_string(idx, "structural_file"));
    apply_string(cfg.indexes.structural_collection, json_string(idx, "structural_collection"));
    apply_string(cfg.indexes.dump_file, json_string(idx, "dump_file"));
    apply_string(cfg.indexes.dump_collection, json_string(idx, "dump_collection"));
    apply_string(cfg.indexes.dump_record, json_string(idx, "dump_record"));
    apply_string(cfg.indexes.dump_name, json_string(idx, "dump_name"));
    apply_string(cfg.indexes.dump_id, json_string(idx, "dump_id"));
  }
}
#endif

#if MDCLONE_ENABLE_DATA_YAML
std::string yaml_string(const YAML::Node& node, const char* key) {
  if (node[key] && node[key].IsScalar()) {
    return node[key].as<std::string>();
  }
  return {};
}

void read_yaml(const YAML::Node& doc, CloneConfig& cfg) {
  const YAML::Node root = doc["clone"] && doc["clone"].IsMap() ? doc["clone"] : doc;

  apply_string(cfg.root, yaml_string(root, "root"));
  apply_string(cfg.type, yaml_string(root, "type"));
  apply_string(cfg.donor, yaml_string(root, "donor"));
  apply_string(cfg.clone, yaml_string(root, "clone"));
  apply_string(cfg.type_group, yaml_string(root, "type_group"));

  if (root["schema"]) {
    const YAML::Node schema = root["schema"];
    if (schema["namespaces"] && schema["namespaces"].IsMap()) {
      cfg.schema.namespaces.clear();
      for (const auto& kv : schema["namespaces"]) {
        cfg.schema.namespaces[kv.first.as<std::string>()] = kv.second.as<std::string>();
      }
    }
    apply_string(cfg.schema.identity_attribute, yaml_string(schema, "identity_attribute"));
    apply_string(cfg.schema.type_id_query, yaml_string(schema, "type_id_query"));
    apply_string(cfg.schema.value_id_query, yaml_string(schema, "value_id_query"));
    if (schema["extra_id_queries"] && schema["extra_id_queries"].IsSequence()) {
      cfg.schema.extra_id_queries.clear();
      for (const auto& query : schema["extra_id_queries"]) {
        cfg.schema.extra_id_queries.push_back(query.as<std::string>());
      }
    }
    if (schema["regenerate_nested_uuids"]) {
      cfg.schema.regenerate_nested_uuids = schema["regenerate_nested_uuids"].as<bool>();
    }
    if (schema["write_bom"]) {
      cfg.schema.write_bom = schema["write_bom"].as<bool>();
    }
  }

  if (root["indexes"]) {
    const YAML::Node idx = root["indexes"];
    apply_string(cfg.indexes.structural_file, yaml_string(idx, "structural_file"));
    apply_string(cfg.indexes.structural_collection, yaml_string(idx, "structural_collection"));
    apply_string(cfg.indexes.dump_file, yaml_string(idx, "dump_file"));
    apply_string(cfg.indexes.dump_collection, yaml_string(idx, "dump_collection"));
    apply_string(cfg.indexes.dump_record, yaml_string(idx, "dump_record"));
    apply_string(cfg.indexes.dump_name, yaml_string(idx, "dump_name"));
    apply_string(cfg.indexes.dump_id, yaml_string(idx, "dump_id"));
  }
}
#endif
} // namespace

CloneConfig load_clone_config(const std::filesystem::path& path) {
  CloneConfig cfg;

  if (!file_exists(path)) {
    log::warn(std::string("config not found: ") + path.string());
    return cfg;
  }

  const auto ext = path.extension().string();
  if (ext == ".json") {
#if MDCLONE_ENABLE_DATA_JSON
    std::ifstream in(path);
    const nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      log::warn(std::string("config is not a JSON object; using defaults: ") + path.string());
      return cfg;
    }
    try {
      read_json(j, cfg);
    } catch (const nlohmann::json::exception& e) {
      log::warn(std::string("config field has the wrong type: ") + e.what());
    }
#else
    log::warn("JSON config requested but JSON support is disabled.");
#endif
    return cfg;
  }

  if (ext == ".yaml" || ext == ".yml") {
#if MDCLONE_ENABLE_DATA_YAML
    try {
      read_yaml(YAML::LoadFile(path.string()), cfg);
    } catch (const YAML::Exception& e) {
      log::warn(std::string("config could not be read: ") + e.what());
    }
#else
    log::warn("YAML config requested but YAML support is disabled.");
#endif
    return cfg;
  }

  log::warn("Unknown config extension; using defaults.");
  return cfg;
}

} // namespace mdclone
