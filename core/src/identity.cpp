#include "mdclone/identity.h"

#include <set>
#include <vector>

namespace mdclone {

namespace {
bool select_role(const xml::Document& doc,
                 const SchemaOptions& schema,
                 const std::string& query,
                 bool required,
                 std::vector<xmlNode*>& out,
                 Error& error) {
  std::string reason;
  if (!xml::select_nodes(doc, query, schema.namespaces, out, reason)) {
    return fail(error, ErrorKind::missing_identifier_nodes, reason, doc.source());
  }
  if (required && out.empty()) {
    return fail(error, ErrorKind::missing_identifier_nodes,
                "no nodes match '" + query + "'", doc.source());
  }
  return true;
}

struct PlannedWrite {
  xmlNode* node;
  size_t* counter;
};

bool has_ancestor_in(const xmlNode* node, const std::set<const xmlNode*>& nodes) {
  for (const xmlNode* cur = node->parent; cur; cur = cur->parent) {
    if (nodes.count(cur)) return true;
  }
  return false;
}

// Drops duplicates and nodes nested inside another selected node. Decided on
// the untouched tree, since set_text frees the children of the node it writes.
void plan_text_writes(const std::vector<xmlNode*>& nodes,
                      size_t* counter,
                      const std::set<const xmlNode*>& selected,
                      std::set<const xmlNode*>& planned,
                      std::vector<PlannedWrite>& plan) {
  for (xmlNode* node : nodes) {
    if (node->type != XML_ELEMENT_NODE || planned.count(node) || has_ancestor_in(node, selected)) {
      continue;
    }
    planned.insert(node);
    plan.push_back(PlannedWrite{node, counter});
  }
}

void regenerate_nested(xmlNode* node, const std::string& attribute, IdSource& ids, size_t& count) {
  for (xmlNode* cur = node->children; cur; cur = cur->next) {
    if (cur->type != XML_ELEMENT_NODE) continue;
    if (xml::has_attribute(cur, attribute)) {
      xml::set_attribute(cur, attribute, ids.next());
      ++count;
    }
    regenerate_nested(cur, attribute, ids, count);
  }
}
} // namespace

xmlNode* root_object(const xml::Document& doc, const std::string& identity_attribute) {
  xmlNode* root = doc.root();
  if (xml::has_attribute(root, identity_attribute)) return root;
  xmlNode* object = xml::first_element_child(root);
  return xml::has_attribute(object, identity_attribute) ? object : nullptr;
}

bool regenerate_identifiers(xml::Document& doc,
                            const SchemaOptions& schema,
                            IdSource& ids,
                            IdentityStats& stats,
                            Error& error) {
  stats = IdentityStats{};
  xmlNode* object = root_object(doc, schema.identity_attribute);
  if (!object) {
    return fail(error, ErrorKind::missing_identifier_nodes,
                "no root object carries '" + schema.identity_attribute + "'", doc.source());
  }

  // Every query is resolved before the first write.
  std::vector<xmlNode*> type_nodes;
  std::vector<xmlNode*> value_nodes;
  if (!select_role(doc, schema, schema.type_id_query, true, type_nodes, error)) return false;
  if (!select_role(doc, schema, schema.value_id_query, true, value_nodes, error)) return false;
  std::vector<std::vector<xmlNode*>> extra_nodes(schema.extra_id_queries.size());
  for (size_t i = 0; i < schema.extra_id_queries.size(); ++i) {
    if (!select_role(doc, schema, schema.extra_id_queries[i], false, extra_nodes[i], error)) {
      return false;
    }
  }

  xml::set_attribute(object, schema.identity_attribute, ids.next());
  stats.root_ids = 1;

  std::set<const xmlNode*> selected(type_nodes.begin(), type_nodes.end());
  selected.insert(value_nodes.begin(), value_nodes.end());
  for (const auto& nodes : extra_nodes) {
    selected.insert(nodes.begin(), nodes.end());
  }
  std::set<const xmlNode*> planned;
  std::vector<PlannedWrite> plan;
  plan_text_writes(type_nodes, &stats.type_ids, selected, planned, plan);
  plan_text_writes(value_nodes, &stats.value_ids, selected, planned, plan);
  for (const auto& nodes : extra_nodes) {
    plan_text_writes(nodes, &stats.extra_ids, selected, planned, plan);
  }

  for (const PlannedWrite& write : plan) {
    xml::set_text(write.node, ids.next());
    ++*write.counter;
  }

  if (schema.regenerate_nested_uuids) {
    regenerate_nested(object, schema.identity_attribute, ids, stats.nested_ids);
  }
  return true;
}

} // namespace mdclone
