#include "mdclone/errors.h"

#include <utility>

namespace mdclone {

const char* error_code(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::none:
      return "ok";
    case ErrorKind::invalid_request:
      return "invalid_request";
    case ErrorKind::artifact_not_found:
      return "artifact_not_found";
    case ErrorKind::malformed_artifact:
      return "malformed_artifact";
    case ErrorKind::missing_identifier_nodes:
      return "missing_identifier_nodes";
    case ErrorKind::write_error:
      return "write_error";
  }
  return "unknown";
}

std::string Error::describe() const {
  std::string out = error_code(kind);
  if (!message.empty()) {
    out += ": " + message;
  }
  if (!path.empty()) {
    out += " (" + path.string() + ")";
  }
  return out;
}

bool fail(Error& error, ErrorKind kind, std::string message, const std::filesystem::path& path) {
  error.kind = kind;
  error.message = std::move(message);
  error.path = path;
  return false;
}

} // namespace mdclone
