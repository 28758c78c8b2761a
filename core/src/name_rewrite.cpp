#include "mdclone/name_rewrite.h"

namespace mdclone {

std::string rewrite_qualified_names(const std::string& text,
                                    const std::string& donor_name,
                                    const std::string& clone_name,
                                    RewriteStats* stats) {
  if (donor_name.empty()) return text;

  const std::string path_from = "." + donor_name;
  const std::string path_to = "." + clone_name;
  const std::string value_from = ">" + donor_name + "<";
  const std::string value_to = ">" + clone_name + "<";

  RewriteStats local;
  std::string out;
  out.reserve(text.size());
  size_t pos = 0;
  while (pos < text.size()) {
    const char c = text[pos];
    if (c == '.' && text.compare(pos, path_from.size(), path_from) == 0) {
      out += path_to;
      pos += path_from.size();
      ++local.path_suffixes;
      continue;
    }
    if (c == '>' && text.compare(pos, value_from.size(), value_from) == 0) {
      out += value_to;
      pos += value_from.size();
      ++local.text_values;
      continue;
    }
    out += c;
    ++pos;
  }

  if (stats) *stats = local;
  return out;
}

} // namespace mdclone
