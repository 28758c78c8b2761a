#include "mdclone/xml_store.h"

#include "mdclone/log.h"

#include <libxml/parser.h>
#include <libxml/xmlerror.h>
#include <libxml/xmlsave.h>
#include <libxml/xpath.h>
#include <libxml/xpathInternals.h>

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace mdclone::xml {
namespace fs = std::filesystem;

namespace {
constexpr int kParseOptions = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;
constexpr char kUtf8Bom[] = "\xEF\xBB\xBF";

const xmlChar* as_xml(const std::string& text) {
  return reinterpret_cast<const xmlChar*>(text.c_str());
}

std::string from_xml(const xmlChar* text) {
  if (!text) return {};
  return std::string(reinterpret_cast<const char*>(text));
}

struct XmlCharFree {
  void operator()(xmlChar* p) const { xmlFree(p); }
};
using XmlString = std::unique_ptr<xmlChar, XmlCharFree>;

struct XPathContextFree {
  void operator()(xmlXPathContext* ctx) const { xmlXPathFreeContext(ctx); }
};

struct XPathObjectFree {
  void operator()(xmlXPathObject* obj) const { xmlXPathFreeObject(obj); }
};

std::string last_parse_error() {
  const xmlError* err = xmlGetLastError();
  if (!err || !err->message) {
    return "document is not well-formed";
  }
  std::string msg = err->message;
  while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) {
    msg.pop_back();
  }
  return "line " + std::to_string(err->line) + ": " + msg;
}

void on_generic_error(void*, const char* fmt, ...) {
  static thread_local std::string pending;
  char buffer[1024];
  va_list args;
  va_start(args, fmt);
  std::vsnprintf(buffer, sizeof(buffer), fmt, args);
  va_end(args);
  pending += buffer;
  for (auto nl = pending.find('\n'); nl != std::string::npos; nl = pending.find('\n')) {
    const std::string line = pending.substr(0, nl);
    pending.erase(0, nl + 1);
    if (!line.empty()) log::warn("libxml2: " + line);
  }
}

fs::path temp_sibling(const fs::path& path) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  fs::path tmp = path;
  tmp += "." + std::to_string(stamp) + ".tmp";
  return tmp;
}
} // namespace

void DocFree::operator()(xmlDoc* doc) const {
  if (doc) xmlFreeDoc(doc);
}

void route_errors_to_log() {
  xmlSetGenericErrorFunc(nullptr, on_generic_error);
}

Document::Document(xmlDoc* doc, fs::path source) : doc_(doc), source_(std::move(source)) {}

xmlNode* Document::root() const {
  return doc_ ? xmlDocGetRootElement(doc_.get()) : nullptr;
}

bool read_text(const fs::path& path, std::string& out, Error& error) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return fail(error, ErrorKind::artifact_not_found, "file not found", path);
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return fail(error, ErrorKind::artifact_not_found, "file not readable", path);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

bool parse(const std::string& text, const fs::path& label, Document& out, Error& error) {
  size_t offset = 0;
  if (text.compare(0, 3, kUtf8Bom) == 0) {
    offset = 3;
  }
  xmlResetLastError();
  xmlDoc* doc = xmlReadMemory(text.data() + offset, static_cast<int>(text.size() - offset),
                              label.string().c_str(), "UTF-8", kParseOptions);
  if (!doc) {
    return fail(error, ErrorKind::malformed_artifact, last_parse_error(), label);
  }
  out = Document(doc, label);
  if (!out.root()) {
    return fail(error, ErrorKind::malformed_artifact, "document has no root element", label);
  }
  return true;
}

bool load(const fs::path& path, Document& out, Error& error) {
  std::string text;
  if (!read_text(path, text, error)) {
    return false;
  }
  return parse(text, path, out, error);
}

bool serialize(const Document& doc, std::string& out, const SaveOptions& options, Error& error) {
  if (doc.empty()) {
    return fail(error, ErrorKind::write_error, "no document to serialize", doc.source());
  }
  xmlChar* mem = nullptr;
  int size = 0;
  xmlDocDumpFormatMemoryEnc(doc.get(), &mem, &size, "UTF-8", 0);
  XmlString holder(mem);
  if (!mem || size <= 0) {
    return fail(error, ErrorKind::write_error, "serialization failed", doc.source());
  }
  out.clear();
  if (options.write_bom) {
    out += kUtf8Bom;
  }
  out.append(reinterpret_cast<const char*>(mem), static_cast<size_t>(size));
  return true;
}

bool save(const Document& doc, const fs::path& path, const SaveOptions& options, Error& error) {
  std::string content;
  if (!serialize(doc, content, options, error)) {
    error.path = path;
    return false;
  }

  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      return fail(error, ErrorKind::write_error,
                  "cannot create directory " + path.parent_path().string() + ": " + ec.message(),
                  path);
    }
  }

  const fs::path tmp = temp_sibling(path);
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      return fail(error, ErrorKind::write_error, "cannot open temporary file", tmp);
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
      out.close();
      fs::remove(tmp, ec);
      return fail(error, ErrorKind::write_error, "write failed", tmp);
    }
  }

  fs::rename(tmp, path, ec);
  if (ec) {
    const std::string reason = ec.message();
    std::error_code cleanup_ec;
    fs::remove(tmp, cleanup_ec);
    return fail(error, ErrorKind::write_error, "rename failed: " + reason, path);
  }
  return true;
}

bool delete_if_exists(const fs::path& path, bool& removed, Error& error) {
  removed = false;
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return true;
  }
  removed = fs::remove(path, ec);
  if (ec) {
    return fail(error, ErrorKind::write_error, "cannot remove file: " + ec.message(), path);
  }
  return true;
}

bool select_nodes(const Document& doc,
                  const std::string& query,
                  const NamespaceMap& namespaces,
                  std::vector<xmlNode*>& out,
                  std::string& error) {
  out.clear();
  if (doc.empty()) {
    error = "no document";
    return false;
  }
  std::unique_ptr<xmlXPathContext, XPathContextFree> ctx(xmlXPathNewContext(doc.get()));
  if (!ctx) {
    error = "cannot create XPath context";
    return false;
  }
  for (const auto& [prefix, uri] : namespaces) {
    if (xmlXPathRegisterNs(ctx.get(), as_xml(prefix), as_xml(uri)) != 0) {
      error = "cannot register namespace prefix '" + prefix + "'";
      return false;
    }
  }
  xmlResetLastError();
  std::unique_ptr<xmlXPathObject, XPathObjectFree> result(
      xmlXPathEvalExpression(as_xml(query), ctx.get()));
  if (!result) {
    error = "XPath evaluation failed for '" + query + "'";
    if (const xmlError* err = xmlGetLastError(); err && err->message) {
      std::string detail = err->message;
      while (!detail.empty() && detail.back() == '\n') detail.pop_back();
      error += ": " + detail;
    }
    return false;
  }
  if (result->type != XPATH_NODESET) {
    error = "XPath '" + query + "' does not select nodes";
    return false;
  }
  const xmlNodeSet* set = result->nodesetval;
  if (set) {
    for (int i = 0; i < set->nodeNr; ++i) {
      out.push_back(set->nodeTab[i]);
    }
  }
  return true;
}

std::string local_name(const xmlNode* node) {
  return node ? from_xml(node->name) : std::string();
}

std::string text_of(const xmlNode* node) {
  if (!node) return {};
  XmlString content(xmlNodeGetContent(node));
  return from_xml(content.get());
}

void set_text(xmlNode* node, const std::string& value) {
  if (!node) return;
  xmlNodeSetContent(node, nullptr);
  xmlAddChild(node, xmlNewDocText(node->doc, as_xml(value)));
}

std::string attribute(const xmlNode* node, const std::string& name) {
  if (!node) return {};
  XmlString value(xmlGetProp(node, as_xml(name)));
  return from_xml(value.get());
}

bool has_attribute(const xmlNode* node, const std::string& name) {
  return node && xmlHasProp(node, as_xml(name)) != nullptr;
}

void set_attribute(xmlNode* node, const std::string& name, const std::string& value) {
  if (!node) return;
  xmlSetProp(node, as_xml(name), as_xml(value));
}

xmlNode* first_element_child(const xmlNode* node) {
  if (!node) return nullptr;
  for (xmlNode* cur = node->children; cur; cur = cur->next) {
    if (cur->type == XML_ELEMENT_NODE) return cur;
  }
  return nullptr;
}

xmlNode* child_element(const xmlNode* node, const std::string& name) {
  if (!node) return nullptr;
  for (xmlNode* cur = node->children; cur; cur = cur->next) {
    if (cur->type == XML_ELEMENT_NODE && local_name(cur) == name) return cur;
  }
  return nullptr;
}

std::vector<xmlNode*> element_children(const xmlNode* node) {
  std::vector<xmlNode*> out;
  if (!node) return out;
  for (xmlNode* cur = node->children; cur; cur = cur->next) {
    if (cur->type == XML_ELEMENT_NODE) out.push_back(cur);
  }
  return out;
}

xmlNode* find_descendant(xmlNode* from, const std::string& name) {
  if (!from) return nullptr;
  if (from->type == XML_ELEMENT_NODE && local_name(from) == name) {
    return from;
  }
  for (xmlNode* cur = from->children; cur; cur = cur->next) {
    if (cur->type != XML_ELEMENT_NODE) continue;
    if (xmlNode* found = find_descendant(cur, name)) return found;
  }
  return nullptr;
}

bool is_whitespace_text(const xmlNode* node) {
  if (!node || node->type != XML_TEXT_NODE) return false;
  return xmlIsBlankNode(node) != 0;
}

} // namespace mdclone::xml
