#pragma once

#include "mdclone/config.h"

#include <filesystem>
#include <optional>
#include <string>

struct CliOptions {
  std::optional<std::filesystem::path> config_path;
  std::optional<std::filesystem::path> report_path;
  std::optional<std::filesystem::path> log_dir;
  std::string root;
  std::string type;
  std::string donor;
  std::string clone;
  std::string type_group;
};

// Parses flags starting at argv[first]. Unknown flags are an error.
bool parse_cli_options(int argc, char** argv, int first, CliOptions& out, std::string& error);

// Config file values first, then explicit flags on top.
mdclone::CloneConfig build_clone_config(const CliOptions& opts);

int clone_entity(const CliOptions& opts);
int remove_entity(const CliOptions& opts);
int inspect_type(const CliOptions& opts);

void print_usage();
