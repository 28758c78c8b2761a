#pragma once

#include <string>

namespace mdclone {

// Source of globally unique identifiers (canonical lower-case UUID text).
class IdSource {
 public:
  virtual ~IdSource() = default;
  virtual std::string next() = 0;
};

// 128-bit random UUIDs from libuuid.
class RandomIdSource final : public IdSource {
 public:
  std::string next() override;
};

} // namespace mdclone
