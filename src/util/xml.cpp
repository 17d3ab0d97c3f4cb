#include "agrisim/util/xml.h"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>

#include "agrisim/util/file_io.h"
#include "agrisim/util/strings.h"

namespace agrisim::xml {
namespace {

constexpr const char* kXsiNamespace = "http://www.w3.org/2001/XMLSchema-instance";

// Takes ownership of a libxml2-allocated string.
std::string take_string(xmlChar* s) {
  if (!s) return {};
  std::string out(reinterpret_cast<const char*>(s));
  xmlFree(s);
  return out;
}

bool name_is(const xmlNode* n, const std::string& name) {
  return n->type == XML_ELEMENT_NODE && name == reinterpret_cast<const char*>(n->name);
}

std::string xsi_attribute(_xmlNode* n, const char* attr) {
  if (!n) return {};
  return take_string(xmlGetNsProp(n, BAD_CAST attr, BAD_CAST kXsiNamespace));
}

struct FreeContext {
  void operator()(xmlParserCtxt* c) const { xmlFreeParserCtxt(c); }
};

} // namespace

std::string Node::name() const { return node_ ? reinterpret_cast<const char*>(node_->name) : std::string(); }

Node Node::child(const std::string& name) const {
  if (!node_) return Node();
  for (xmlNode* c = node_->children; c; c = c->next) {
    if (name_is(c, name)) return Node(c);
  }
  return Node();
}

Node Node::path(const std::string& names) const {
  Node cur = *this;
  std::size_t start = 0;
  while (cur && start <= names.size()) {
    const std::size_t slash = names.find('/', start);
    const std::size_t end = slash == std::string::npos ? names.size() : slash;
    cur = cur.child(names.substr(start, end - start));
    if (slash == std::string::npos) break;
    start = slash + 1;
  }
  return cur;
}

std::vector<Node> Node::children(const std::string& name) const {
  std::vector<Node> out;
  if (!node_) return out;
  for (xmlNode* c = node_->children; c; c = c->next) {
    if (c->type != XML_ELEMENT_NODE) continue;
    if (name.empty() || name_is(c, name)) out.emplace_back(c);
  }
  return out;
}

std::string Node::text() const { return node_ ? take_string(xmlNodeGetContent(node_)) : std::string(); }

std::string Node::child_text(const std::string& name, const std::string& def) const {
  const Node c = child(name);
  return c ? trim_copy(c.text()) : def;
}

int Node::child_int(const std::string& name, int def) const {
  const std::string s = child_text(name);
  if (s.empty()) return def;
  char* end = nullptr;
  const double d = std::strtod(s.c_str(), &end);
  if (end == s.c_str() || *end != '\0' || !std::isfinite(d)) return def;
  if (std::fabs(d) > std::numeric_limits<int>::max()) return def;
  return static_cast<int>(d);
}

bool Node::child_flag(const std::string& name) const { return to_lower(child_text(name)) == "true"; }

std::string Node::xsi_type() const { return xsi_attribute(node_, "type"); }

bool Node::xsi_nil() const { return xsi_attribute(node_, "nil") == "true"; }

void Document::Free::operator()(_xmlDoc* d) const { xmlFreeDoc(d); }

Document Document::parse(const std::string& text, const std::string& source_name) {
  if (text.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    throw std::runtime_error(source_name + ": XML document is too large");
  }
  std::unique_ptr<xmlParserCtxt, FreeContext> ctxt(xmlNewParserCtxt());
  if (!ctxt) throw std::runtime_error("failed to allocate an XML parser");

  // Saves are local files: no network access, and no libxml2 chatter on stderr.
  const int options = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING | XML_PARSE_HUGE;
  xmlDoc* doc = xmlCtxtReadMemory(ctxt.get(), text.data(), static_cast<int>(text.size()), source_name.c_str(),
                                  nullptr, options);
  if (!doc) {
    std::string msg = source_name + ": XML parse error";
    if (const xmlError* err = xmlCtxtGetLastError(ctxt.get())) {
      msg += " (line " + std::to_string(err->line) + ")";
      if (err->message) msg += ": " + trim_copy(err->message);
    }
    throw std::runtime_error(msg);
  }
  Document out(doc);
  if (!out.root()) throw std::runtime_error(source_name + ": XML document has no root element");
  return out;
}

Document Document::load_file(const std::string& path) { return parse(read_text_file(path), path); }

Node Document::root() const { return Node(doc_ ? xmlDocGetRootElement(doc_.get()) : nullptr); }

} // namespace agrisim::xml
