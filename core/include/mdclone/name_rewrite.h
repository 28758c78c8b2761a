#pragma once

#include <cstddef>
#include <string>

namespace mdclone {

struct RewriteStats {
  size_t path_suffixes = 0;  // ".Donor"
  size_t text_values = 0;    // ">Donor<"
};

// Rewrites every ".<donor>" to ".<clone>" and every "><donor><" to
// "><clone><". Matching is case-sensitive, left to right, non-overlapping.
// All other bytes are copied unchanged.
std::string rewrite_qualified_names(const std::string& text,
                                    const std::string& donor_name,
                                    const std::string& clone_name,
                                    RewriteStats* stats = nullptr);

} // namespace mdclone
