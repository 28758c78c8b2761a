#pragma once

#include "mdclone/config.h"
#include "mdclone/errors.h"
#include "mdclone/id_source.h"
#include "mdclone/xml_store.h"

#include <cstddef>

namespace mdclone {

struct IdentityStats {
  size_t root_ids = 0;
  size_t type_ids = 0;
  size_t value_ids = 0;
  size_t extra_ids = 0;
  size_t nested_ids = 0;

  size_t total() const { return root_ids + type_ids + value_ids + extra_ids + nested_ids; }
};

// The object a definition artifact describes: the document root when it carries
// `identity_attribute`, else its first element child when that does
// (<MetaDataObject><Catalog uuid="..."> -> Catalog). nullptr otherwise.
xmlNode* root_object(const xml::Document& doc, const std::string& identity_attribute);

// Gives the root object, every type/value/extra identity node and (optionally)
// every nested identity attribute a fresh identifier, one IdSource call each.
// A node inside one already rewritten is skipped.
bool regenerate_identifiers(xml::Document& doc,
                            const SchemaOptions& schema,
                            IdSource& ids,
                            IdentityStats& stats,
                            Error& error);

} // namespace mdclone
