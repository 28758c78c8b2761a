#include "mdclone/id_source.h"

#include <uuid/uuid.h>

namespace mdclone {

std::string RandomIdSource::next() {
  uuid_t raw;
  uuid_generate_random(raw);
  char text[37] = {};
  uuid_unparse_lower(raw, text);
  return std::string(text);
}

} // namespace mdclone
