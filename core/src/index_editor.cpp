#include "mdclone/index_editor.h"

namespace mdclone::index {

namespace {
const xmlChar* as_xml(const std::string& text) {
  return reinterpret_cast<const xmlChar*>(text.c_str());
}

std::string trim(const std::string& text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return {};
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

bool starts_with(const std::string& text, const std::string& prefix) {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool is_record(const xmlNode* node, const IndexSchema& schema) {
  if (!node || node->type != XML_ELEMENT_NODE) return false;
  return schema.record_element.empty() || xml::local_name(node) == schema.record_element;
}

std::string read_field(const xmlNode* record, const FieldSpec& field) {
  switch (field.source) {
    case FieldSpec::Source::text:
      return trim(xml::text_of(record));
    case FieldSpec::Source::attribute:
      return xml::attribute(record, field.key);
    case FieldSpec::Source::child:
      return trim(xml::text_of(xml::child_element(record, field.key)));
  }
  return {};
}

void write_field(xmlNode* record, const FieldSpec& field, const std::string& value) {
  switch (field.source) {
    case FieldSpec::Source::text:
      xml::set_text(record, value);
      break;
    case FieldSpec::Source::attribute:
      xml::set_attribute(record, field.key, value);
      break;
    case FieldSpec::Source::child: {
      xmlNode* child = xmlNewDocNode(record->doc, record->ns, as_xml(field.key), nullptr);
      xml::set_text(child, value);
      xmlAddChild(record, child);
      break;
    }
  }
}

std::string leading_whitespace(const xmlNode* node) {
  if (!node || !xml::is_whitespace_text(node->prev)) return {};
  return xml::text_of(node->prev);
}

xmlNs* namespace_for_new_record(const xmlNode* collection, const xmlNode* anchor,
                                const IndexSchema& schema) {
  if (anchor) return anchor->ns;
  for (xmlNode* cur = collection->children; cur; cur = cur->next) {
    if (is_record(cur, schema)) return cur->ns;
  }
  return collection->ns;
}
} // namespace

bool parse_field_spec(const std::string& text, FieldSpec& out, std::string& error) {
  if (text.empty() || text == "text") {
    out = FieldSpec{};
    return true;
  }
  const auto colon = text.find(':');
  if (colon == std::string::npos || colon + 1 >= text.size()) {
    error = "expected text, attribute:<name> or child:<name>, got '" + text + "'";
    return false;
  }
  const std::string kind = text.substr(0, colon);
  FieldSpec spec;
  spec.key = text.substr(colon + 1);
  if (kind == "attribute") {
    spec.source = FieldSpec::Source::attribute;
  } else if (kind == "child") {
    spec.source = FieldSpec::Source::child;
  } else {
    error = "unknown field source '" + kind + "'";
    return false;
  }
  out = spec;
  return true;
}

IndexSchema structural_schema(const std::string& collection) {
  IndexSchema schema;
  schema.label = "structural";
  schema.collection = collection;
  return schema;
}

IndexSchema dump_schema(const std::string& collection,
                        const std::string& record_element,
                        const FieldSpec& name,
                        const std::optional<FieldSpec>& id) {
  IndexSchema schema;
  schema.label = "dump";
  schema.collection = collection;
  schema.record_element = record_element;
  schema.group_by_prefix = true;
  schema.name = name;
  schema.id = id;
  return schema;
}

const char* placement_name(Placement placement) {
  switch (placement) {
    case Placement::none:
      return "none";
    case Placement::after_peer:
      return "after_peer";
    case Placement::appended:
      return "appended";
  }
  return "none";
}

xmlNode* record_collection(const xml::Document& doc, const IndexSchema& schema) {
  xmlNode* root = doc.root();
  if (!root) return nullptr;
  if (schema.collection.empty()) return root;
  return xml::find_descendant(root, schema.collection);
}

std::string record_name(const xmlNode* record, const IndexSchema& schema) {
  return read_field(record, schema.name);
}

bool record_is_of_type(const xmlNode* record, const IndexSchema& schema, const std::string& type) {
  if (!is_record(record, schema)) return false;
  if (schema.group_by_prefix) {
    return starts_with(record_name(record, schema), type + ".");
  }
  return xml::local_name(record) == type;
}

std::vector<xmlNode*> records_of_type(const xml::Document& doc,
                                      const IndexSchema& schema,
                                      const std::string& type) {
  std::vector<xmlNode*> out;
  const xmlNode* collection = record_collection(doc, schema);
  if (!collection) return out;
  for (xmlNode* cur = collection->children; cur; cur = cur->next) {
    if (record_is_of_type(cur, schema, type)) out.push_back(cur);
  }
  return out;
}

std::vector<xmlNode*> find_records(const xml::Document& doc,
                                   const IndexSchema& schema,
                                   const std::string& qualified_name) {
  std::vector<xmlNode*> out;
  const xmlNode* collection = record_collection(doc, schema);
  if (!collection) return out;
  for (xmlNode* cur = collection->children; cur; cur = cur->next) {
    if (is_record(cur, schema) && record_name(cur, schema) == qualified_name) {
      out.push_back(cur);
    }
  }
  return out;
}

xmlNode* find_record(const xml::Document& doc,
                     const IndexSchema& schema,
                     const std::string& qualified_name) {
  auto records = find_records(doc, schema, qualified_name);
  return records.empty() ? nullptr : records.front();
}

void remove_record(xmlNode* record) {
  if (!record || !record->parent) return;
  xmlNode* indent = record->prev;
  if (xml::is_whitespace_text(indent)) {
    xmlUnlinkNode(indent);
    xmlFreeNode(indent);
  }
  xmlUnlinkNode(record);
  xmlFreeNode(record);
}

InsertResult insert_after_last_of_type(xml::Document& doc,
                                       const IndexSchema& schema,
                                       const std::string& type,
                                       const std::string& qualified_name,
                                       IdSource& ids) {
  InsertResult result;
  xmlNode* collection = record_collection(doc, schema);
  if (!collection) return result;

  const auto peers = records_of_type(doc, schema, type);
  xmlNode* anchor = peers.empty() ? nullptr : peers.back();

  const std::string element = schema.record_element.empty() ? type : schema.record_element;
  xmlNode* record = xmlNewDocNode(doc.get(), namespace_for_new_record(collection, anchor, schema),
                                  as_xml(element), nullptr);
  write_field(record, schema.name, qualified_name);
  if (schema.id.has_value()) {
    write_field(record, schema.id.value(), ids.next());
  }

  std::string indent;
  if (anchor) {
    indent = leading_whitespace(anchor);
    xmlAddNextSibling(anchor, record);
    result.placement = Placement::after_peer;
  } else {
    xmlNode* last_record = nullptr;
    for (xmlNode* cur = collection->children; cur; cur = cur->next) {
      if (cur->type == XML_ELEMENT_NODE) last_record = cur;
    }
    const std::string outer = leading_whitespace(collection);
    indent = last_record ? leading_whitespace(last_record) : (outer.empty() ? "" : outer + "\t");

    xmlNode* tail = collection->last;
    if (xml::is_whitespace_text(tail)) {
      xmlAddPrevSibling(tail, record);
    } else {
      xmlAddChild(collection, record);
      if (!outer.empty()) {
        xmlAddChild(collection, xmlNewDocText(doc.get(), as_xml(outer)));
      }
    }
    result.placement = Placement::appended;
  }

  if (!indent.empty()) {
    xmlAddPrevSibling(record, xmlNewDocText(doc.get(), as_xml(indent)));
  }
  result.record = record;
  return result;
}

} // namespace mdclone::index
