#pragma once

#include <memory>
#include <string>
#include <vector>

// Forward declarations from libxml2 keep <libxml/tree.h> out of the headers.
struct _xmlDoc;
struct _xmlNode;

namespace agrisim::xml {

// Non-owning handle to an element of a Document. A null handle behaves like an
// empty element: it has no children and no text, so lookups can be chained
// (`root.child("player").child("professions")`) without checks at each step.
class Node {
 public:
  Node() = default;
  explicit Node(_xmlNode* n) : node_(n) {}

  explicit operator bool() const { return node_ != nullptr; }

  std::string name() const;

  // First child element named `name`, or a null handle.
  Node child(const std::string& name) const;
  // Follows a '/'-separated chain of child names ("value/TerrainFeature").
  Node path(const std::string& names) const;

  // Child elements named `name`; every child element when `name` is empty.
  std::vector<Node> children(const std::string& name = "") const;

  // Concatenated text content; empty for a null handle.
  std::string text() const;
  // Trimmed text of the first child named `name`; `def` when it is missing.
  std::string child_text(const std::string& name, const std::string& def = "") const;
  // Integer text of a child; `def` when missing or not a number. Accepts
  // "12.0" (positions are serialized as floats).
  int child_int(const std::string& name, int def = 0) const;
  // True when the child's text is "true" (any case).
  bool child_flag(const std::string& name) const;

  // The xsi:type attribute, which names the concrete class of a serialized
  // object ("HoeDirt", "FruitTree"). Empty when absent.
  std::string xsi_type() const;
  // True for xsi:nil="true" placeholders (empty inventory slots).
  bool xsi_nil() const;

 private:
  _xmlNode* node_{nullptr};
};

// Owns a parsed libxml2 document.
class Document {
 public:
  // Throws std::runtime_error with the parser's line number and message.
  static Document parse(const std::string& text, const std::string& source_name = "document");
  static Document load_file(const std::string& path);

  Node root() const;

 private:
  struct Free {
    void operator()(_xmlDoc* d) const;
  };
  explicit Document(_xmlDoc* d) : doc_(d) {}

  std::unique_ptr<_xmlDoc, Free> doc_;
};

} // namespace agrisim::xml
