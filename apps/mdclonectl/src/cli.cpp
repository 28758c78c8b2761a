#include "mdclonectl/cli_api.h"

#include "mdclone/clone_pipeline.h"
#include "mdclone/log.h"
#include "mdclone/run_report.h"

#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {
void override_if_set(std::string& dst, const std::string& value) {
  if (!value.empty()) dst = value;
}

void print_result(const mdclone::CloneResult& result) {
  if (result.success) {
    std::cout << "OK " << result.clone_path.string() << "\n";
    return;
  }
  std::cerr << "FAILED " << result.error.describe() << "\n";
}

int finish(const CliOptions& opts, const mdclone::ClonePipeline& pipeline,
           const mdclone::CloneResult& result) {
  print_result(result);
  if (opts.report_path.has_value()) {
    std::string error;
    if (!mdclone::write_run_report(opts.report_path.value(), result, pipeline.layout(), error)) {
      mdclone::log::warn("report not written: " + error);
    }
  }
  return result.success ? 0 : 1;
}

bool print_records(const fs::path& path, const mdclone::index::IndexSchema& schema,
                   const std::string& type) {
  mdclone::xml::Document doc;
  mdclone::Error error;
  if (!mdclone::xml::load(path, doc, error)) {
    std::cerr << "FAILED " << error.describe() << "\n";
    return false;
  }
  if (!mdclone::index::record_collection(doc, schema)) {
    std::cerr << "FAILED " << path.filename().string() << ": record collection '"
              << schema.collection << "' not found\n";
    return false;
  }
  const auto records = mdclone::index::records_of_type(doc, schema, type);
  std::cout << path.filename().string() << ": " << records.size() << " " << type
            << " record(s)\n";
  for (const xmlNode* record : records) {
    std::cout << "  " << mdclone::index::record_name(record, schema) << "\n";
  }
  return true;
}
} // namespace

bool parse_cli_options(int argc, char** argv, int first, CliOptions& out, std::string& error) {
  for (int i = first; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    if (arg == "--config" && has_value) {
      out.config_path = fs::path(argv[++i]);
    } else if (arg == "--report" && has_value) {
      out.report_path = fs::path(argv[++i]);
    } else if (arg == "--log-dir" && has_value) {
      out.log_dir = fs::path(argv[++i]);
    } else if (arg == "--root" && has_value) {
      out.root = argv[++i];
    } else if (arg == "--type" && has_value) {
      out.type = argv[++i];
    } else if (arg == "--donor" && has_value) {
      out.donor = argv[++i];
    } else if (arg == "--clone" && has_value) {
      out.clone = argv[++i];
    } else if (arg == "--type-group" && has_value) {
      out.type_group = argv[++i];
    } else {
      error = "unexpected argument: " + arg;
      return false;
    }
  }
  return true;
}

mdclone::CloneConfig build_clone_config(const CliOptions& opts) {
  mdclone::CloneConfig cfg;
  if (opts.config_path.has_value()) {
    cfg = mdclone::load_clone_config(opts.config_path.value());
  }
  override_if_set(cfg.root, opts.root);
  override_if_set(cfg.type, opts.type);
  override_if_set(cfg.donor, opts.donor);
  override_if_set(cfg.clone, opts.clone);
  override_if_set(cfg.type_group, opts.type_group);
  return cfg;
}

int clone_entity(const CliOptions& opts) {
  mdclone::RandomIdSource ids;
  mdclone::ClonePipeline pipeline(build_clone_config(opts), ids);
  return finish(opts, pipeline, pipeline.run());
}

int remove_entity(const CliOptions& opts) {
  mdclone::RandomIdSource ids;
  mdclone::ClonePipeline pipeline(build_clone_config(opts), ids);
  return finish(opts, pipeline, pipeline.remove_traces());
}

int inspect_type(const CliOptions& opts) {
  const auto cfg = build_clone_config(opts);
  if (cfg.type.empty()) {
    print_usage();
    return 1;
  }
  mdclone::RandomIdSource ids;
  mdclone::ClonePipeline pipeline(cfg, ids);
  const bool structural_ok =
      print_records(pipeline.layout().structural_index, pipeline.structural_schema(), cfg.type);
  const bool dump_ok =
      print_records(pipeline.layout().dump_index, pipeline.dump_schema(), cfg.type);
  return structural_ok && dump_ok ? 0 : 1;
}

void print_usage() {
  std::cout << "Usage:\n"
            << "  mdclonectl clone [--config <file>] --root <path> --type <Type> --donor <Name> --clone <Name> [--type-group <dir>] [--report <file>] [--log-dir <dir>]\n"
            << "  mdclonectl remove [--config <file>] --root <path> --type <Type> --clone <Name> [--type-group <dir>] [--report <file>] [--log-dir <dir>]\n"
            << "  mdclonectl inspect [--config <file>] --root <path> --type <Type>\n";
}
