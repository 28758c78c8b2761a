#pragma once

#include <filesystem>
#include <string>

namespace mdclone {

enum class ErrorKind {
  none,
  invalid_request,
  artifact_not_found,
  malformed_artifact,
  missing_identifier_nodes,
  write_error,
};

// Stable snake_case code used in logs, reports and CLI output.
const char* error_code(ErrorKind kind);

struct Error {
  ErrorKind kind = ErrorKind::none;
  std::string message;
  std::filesystem::path path;

  bool ok() const { return kind == ErrorKind::none; }
  std::string describe() const;
};

bool fail(Error& error, ErrorKind kind, std::string message, const std::filesystem::path& path = {});

} // namespace mdclone
