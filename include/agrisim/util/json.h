#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace agrisim::json {

struct Value;
using Array = std::vector<Value>;
using Object = std::unordered_map<std::string, Value>;

// Config and report documents: null, bool, number, string, array, object.
struct Value : std::variant<std::nullptr_t, bool, double, std::string, Array, Object> {
  using variant::variant;

  // Counts are stored as doubles; these keep call sites unambiguous.
  Value(int v) : variant(static_cast<double>(v)) {}
  Value(std::int64_t v) : variant(static_cast<double>(v)) {}
  Value(const char* s) : variant(std::string(s)) {}

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(*this); }
  bool is_bool() const { return std::holds_alternative<bool>(*this); }
  bool is_number() const { return std::holds_alternative<double>(*this); }
  bool is_string() const { return std::holds_alternative<std::string>(*this); }
  bool is_array() const { return std::holds_alternative<Array>(*this); }
  bool is_object() const { return std::holds_alternative<Object>(*this); }

  const Object* as_object() const { return std::get_if<Object>(this); }

  // Throws std::runtime_error when this is not an object or the key is absent.
  const Value& at(const std::string& key) const;

  // Typed reads that fall back to `def` on a type mismatch.
  bool bool_value(bool def = false) const;
  double number_value(double def = 0.0) const;
  std::int64_t int_value(std::int64_t def = 0) const;
  std::string string_value(const std::string& def = "") const;

  // Throw std::runtime_error on a type mismatch.
  const Object& object() const;
  const Array& array() const;
};

// Returns nullptr when `key` is absent.
const Value* find(const Object& o, const std::string& key);

// Parses a whole document. A leading UTF-8 BOM is skipped. Errors are
// std::runtime_error with the line and column of the offending character.
Value parse(const std::string& text);

// Object keys are written in sorted order so exported reports diff cleanly.
// indent 0 writes everything on one line.
std::string stringify(const Value& v, int indent = 2);

Value object(Object o);
Value array(Array a);

} // namespace agrisim::json
