#include "agrisim/util/json.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace agrisim::json {
namespace {

constexpr const char kBom[] = "\xEF\xBB\xBF";

bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

// Walks the document one character at a time and keeps the human-facing
// position (1-based line and column, CR not counted) in step with it.
class Reader {
 public:
  explicit Reader(const std::string& text) : text_(text) {
    if (text_.compare(0, 3, kBom) == 0) pos_ = 3;
  }

  Value document() {
    Value v = value();
    blank();
    if (!done()) fail("unexpected trailing characters");
    return v;
  }

 private:
  bool done() const { return pos_ >= text_.size(); }
  char here() const { return done() ? '\0' : text_[pos_]; }

  char take() {
    if (done()) return '\0';
    const char c = text_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else if (c != '\r') {
      ++col_;
    }
    return c;
  }

  void blank() {
    while (!done() && std::isspace(static_cast<unsigned char>(here()))) take();
  }

  [[noreturn]] void fail(const std::string& what) const {
    std::ostringstream ss;
    ss << "JSON parse error (line " << line_ << ", col " << col_ << "): " << what;
    throw std::runtime_error(ss.str());
  }

  void want(char c, const char* what) {
    blank();
    if (here() != c) fail(std::string("expected ") + what);
    take();
  }

  // True (and consumed) when the next non-blank character is `c`.
  bool next_is(char c) {
    blank();
    if (here() != c) return false;
    take();
    return true;
  }

  Value value() {
    blank();
    switch (here()) {
      case '{': return record();
      case '[': return list();
      case '"': return text();
      case 't': return word("true", true);
      case 'f': return word("false", false);
      case 'n': return word("null", nullptr);
      default: break;
    }
    if (here() == '-' || is_digit(here())) return number();
    if (done()) fail("unexpected end of input");
    fail(std::string("unexpected character '") + here() + "'");
  }

  Value word(const char* w, Value v) {
    for (const char* p = w; *p; ++p) {
      if (here() != *p) fail(std::string("unexpected token, expected '") + w + "'");
      take();
    }
    return v;
  }

  void digits(const char* what) {
    if (!is_digit(here())) fail(std::string("expected digits in ") + what);
    while (is_digit(here())) take();
  }

  Value number() {
    const std::size_t start = pos_;
    if (here() == '-') take();
    if (here() == '0') {
      take();
    } else {
      digits("number");
    }
    if (here() == '.') {
      take();
      digits("fraction");
    }
    if (here() == 'e' || here() == 'E') {
      take();
      if (here() == '+' || here() == '-') take();
      digits("exponent");
    }
    std::istringstream in(text_.substr(start, pos_ - start));
    in.imbue(std::locale::classic());
    double d = 0.0;
    in >> d;
    if (in.fail()) fail("number out of range");
    return d;
  }

  // Config files are plain text; \u escapes outside the BMP are rejected.
  void escape(std::string& out) {
    const char e = take();
    switch (e) {
      case '"':
      case '\\':
      case '/': out.push_back(e); return;
      case 'b': out.push_back('\b'); return;
      case 'f': out.push_back('\f'); return;
      case 'n': out.push_back('\n'); return;
      case 'r': out.push_back('\r'); return;
      case 't': out.push_back('\t'); return;
      case 'u': break;
      default: fail("unknown escape sequence");
    }
    unsigned cp = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = take();
      if (!std::isxdigit(static_cast<unsigned char>(h))) fail("expected four hex digits after \\u");
      cp = cp * 16 + static_cast<unsigned>(is_digit(h) ? h - '0' : std::tolower(h) - 'a' + 10);
    }
    if (cp >= 0xD800 && cp <= 0xDFFF) fail("surrogate \\u escapes are not supported");
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  std::string raw_text() {
    want('"', "'\"'");
    std::string out;
    for (;;) {
      if (done()) fail("unterminated string");
      const char c = take();
      if (c == '"') return out;
      if (c == '\\') {
        escape(out);
      } else {
        out.push_back(c);
      }
    }
  }

  Value text() { return raw_text(); }

  Value list() {
    take();
    Array items;
    if (next_is(']')) return items;
    do {
      items.push_back(value());
    } while (next_is(','));
    want(']', "',' or ']'");
    return items;
  }

  Value record() {
    take();
    Object fields;
    if (next_is('}')) return fields;
    do {
      blank();
      if (here() != '"') fail("expected a quoted key");
      std::string key = raw_text();
      want(':', "':'");
      fields[std::move(key)] = value();
    } while (next_is(','));
    want('}', "',' or '}'");
    return fields;
  }

  const std::string& text_;
  std::size_t pos_{0};
  int line_{1};
  int col_{1};
};

// Pretty printer for reports; `indent_` spaces per nesting level.
class Writer {
 public:
  explicit Writer(int indent) : indent_(std::max(0, indent)) {}

  std::string finish() { return out_.str(); }

  void write(const Value& v, int depth) {
    if (v.is_null()) {
      out_ << "null";
    } else if (const bool* b = std::get_if<bool>(&v)) {
      out_ << (*b ? "true" : "false");
    } else if (const double* d = std::get_if<double>(&v)) {
      number(*d);
    } else if (const std::string* s = std::get_if<std::string>(&v)) {
      quoted(*s);
    } else if (const Array* a = std::get_if<Array>(&v)) {
      out_ << '[';
      for (std::size_t k = 0; k < a->size(); ++k) {
        if (k) out_ << ',';
        newline(depth + 1);
        write((*a)[k], depth + 1);
      }
      if (!a->empty()) newline(depth);
      out_ << ']';
    } else {
      const Object& o = std::get<Object>(v);
      std::vector<const std::string*> keys;
      keys.reserve(o.size());
      for (const auto& [k, _] : o) keys.push_back(&k);
      std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) { return *a < *b; });

      out_ << '{';
      for (std::size_t k = 0; k < keys.size(); ++k) {
        if (k) out_ << ',';
        newline(depth + 1);
        quoted(*keys[k]);
        out_ << (indent_ > 0 ? ": " : ":");
        write(o.at(*keys[k]), depth + 1);
      }
      if (!keys.empty()) newline(depth);
      out_ << '}';
    }
  }

 private:
  void newline(int depth) {
    if (indent_ == 0) return;
    out_ << '\n' << std::string(static_cast<std::size_t>(depth * indent_), ' ');
  }

  // Whole numbers (every count in a report) are written without a fraction.
  void number(double d) {
    if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 9e15) {
      out_ << static_cast<std::int64_t>(d);
    } else {
      out_ << d;
    }
  }

  void quoted(const std::string& s) {
    out_ << '"';
    for (const char c : s) {
      if (c == '"' || c == '\\') {
        out_ << '\\' << c;
      } else if (c == '\n') {
        out_ << "\\n";
      } else if (c == '\t') {
        out_ << "\\t";
      } else if (static_cast<unsigned char>(c) < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
        out_ << buf;
      } else {
        out_ << c;
      }
    }
    out_ << '"';
  }

  int indent_;
  std::ostringstream out_;
};

} // namespace

const Value& Value::at(const std::string& key) const {
  const Value* v = find(object(), key);
  if (!v) throw std::runtime_error("JSON object missing key: " + key);
  return *v;
}

bool Value::bool_value(bool def) const {
  const bool* p = std::get_if<bool>(this);
  return p ? *p : def;
}

double Value::number_value(double def) const {
  const double* p = std::get_if<double>(this);
  return p ? *p : def;
}

std::int64_t Value::int_value(std::int64_t def) const {
  const double* p = std::get_if<double>(this);
  return p ? static_cast<std::int64_t>(*p) : def;
}

std::string Value::string_value(const std::string& def) const {
  const std::string* p = std::get_if<std::string>(this);
  return p ? *p : def;
}

const Object& Value::object() const {
  if (const Object* o = as_object()) return *o;
  throw std::runtime_error("JSON value is not an object");
}

const Array& Value::array() const {
  if (const Array* a = std::get_if<Array>(this)) return *a;
  throw std::runtime_error("JSON value is not an array");
}

const Value* find(const Object& o, const std::string& key) {
  auto it = o.find(key);
  return it == o.end() ? nullptr : &it->second;
}

Value parse(const std::string& text) { return Reader(text).document(); }

std::string stringify(const Value& v, int indent) {
  Writer w(indent);
  w.write(v, 0);
  return w.finish();
}

Value object(Object o) { return Value(std::move(o)); }
Value array(Array a) { return Value(std::move(a)); }

} // namespace agrisim::json
