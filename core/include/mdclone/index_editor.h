#pragma once

#include "mdclone/id_source.h"
#include "mdclone/xml_store.h"

#include <optional>
#include <string>
#include <vector>

namespace mdclone::index {

// Where a registration record keeps one of its values.
struct FieldSpec {
  enum class Source { text, attribute, child };
  Source source = Source::text;
  std::string key;
};

// Parses "text", "attribute:<name>" or "child:<name>".
bool parse_field_spec(const std::string& text, FieldSpec& out, std::string& error);

struct IndexSchema {
  std::string label;
  // Local name of the element holding the records. Empty means the root.
  std::string collection;
  // Local name of a record element. Empty means the element is named after
  // the entity type, as in <Catalog>Catalog.Items</Catalog>.
  std::string record_element;
  // Records group by the "Type." prefix of their qualified name instead of
  // by element name.
  bool group_by_prefix = false;
  FieldSpec name;
  // A fresh identifier is written here for inserted records.
  std::optional<FieldSpec> id;
};

IndexSchema structural_schema(const std::string& collection);
IndexSchema dump_schema(const std::string& collection,
                        const std::string& record_element,
                        const FieldSpec& name,
                        const std::optional<FieldSpec>& id);

enum class Placement {
  none,
  after_peer,
  appended,
};

const char* placement_name(Placement placement);

// nullptr when the configured collection is absent.
xmlNode* record_collection(const xml::Document& doc, const IndexSchema& schema);
std::string record_name(const xmlNode* record, const IndexSchema& schema);
bool record_is_of_type(const xmlNode* record, const IndexSchema& schema, const std::string& type);

std::vector<xmlNode*> records_of_type(const xml::Document& doc,
                                      const IndexSchema& schema,
                                      const std::string& type);

std::vector<xmlNode*> find_records(const xml::Document& doc,
                                   const IndexSchema& schema,
                                   const std::string& qualified_name);
xmlNode* find_record(const xml::Document& doc,
                     const IndexSchema& schema,
                     const std::string& qualified_name);

// Detaches and frees `record` along with the indentation in front of it.
// No-op for nullptr or a node without a parent.
void remove_record(xmlNode* record);

struct InsertResult {
  xmlNode* record = nullptr;
  Placement placement = Placement::none;
};

// Places the new record right after the last record of `type`, or appends it
// to the record collection when the index holds none of that type yet.
InsertResult insert_after_last_of_type(xml::Document& doc,
                                       const IndexSchema& schema,
                                       const std::string& type,
                                       const std::string& qualified_name,
                                       IdSource& ids);

} // namespace mdclone::index
