#pragma once

#include "mdclone/errors.h"

#include <libxml/tree.h>

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mdclone::xml {

struct DocFree {
  void operator()(xmlDoc* doc) const;
};

// Owning handle for a parsed libxml2 document.
class Document {
 public:
  Document() = default;
  Document(xmlDoc* doc, std::filesystem::path source);

  xmlDoc* get() const { return doc_.get(); }
  xmlNode* root() const;
  bool empty() const { return !doc_; }
  const std::filesystem::path& source() const { return source_; }

 private:
  std::unique_ptr<xmlDoc, DocFree> doc_;
  std::filesystem::path source_;
};

using NamespaceMap = std::map<std::string, std::string>;

// Sends libxml2's generic error output to log::warn, one line at a time.
void route_errors_to_log();

struct SaveOptions {
  bool write_bom = false;
};

bool read_text(const std::filesystem::path& path, std::string& out, Error& error);

// `label` names the document in diagnostics and becomes its base URL.
bool parse(const std::string& text, const std::filesystem::path& label, Document& out, Error& error);
bool load(const std::filesystem::path& path, Document& out, Error& error);

// UTF-8 with an <?xml version="1.0" encoding="UTF-8"?> declaration. Whitespace
// nodes are written back as parsed.
bool serialize(const Document& doc, std::string& out, const SaveOptions& options, Error& error);

// Writes through a temporary sibling and renames it over `path`.
// Parent directories are created when missing.
bool save(const Document& doc,
          const std::filesystem::path& path,
          const SaveOptions& options,
          Error& error);

bool delete_if_exists(const std::filesystem::path& path, bool& removed, Error& error);

// Evaluates an XPath expression with the given prefix bindings. An empty result
// is not an error; an unknown prefix or a bad expression is.
bool select_nodes(const Document& doc,
                  const std::string& query,
                  const NamespaceMap& namespaces,
                  std::vector<xmlNode*>& out,
                  std::string& error);

std::string local_name(const xmlNode* node);
std::string text_of(const xmlNode* node);
void set_text(xmlNode* node, const std::string& value);
std::string attribute(const xmlNode* node, const std::string& name);
bool has_attribute(const xmlNode* node, const std::string& name);
void set_attribute(xmlNode* node, const std::string& name, const std::string& value);

xmlNode* first_element_child(const xmlNode* node);
xmlNode* child_element(const xmlNode* node, const std::string& name);
std::vector<xmlNode*> element_children(const xmlNode* node);
// First element named `name` in document order below and including `from`.
xmlNode* find_descendant(xmlNode* from, const std::string& name);
bool is_whitespace_text(const xmlNode* node);

} // namespace mdclone::xml
