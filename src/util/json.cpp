#include "resflow/util/json.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace resflow::json {
namespace {

class Parser {
 public:
  explicit Parser(const std::string& text) : s_(text) {
    // Content files edited on Windows frequently carry a UTF-8 BOM.
    if (s_.size() >= 3 && static_cast<unsigned char>(s_[0]) == 0xEF &&
        static_cast<unsigned char>(s_[1]) == 0xBB && static_cast<unsigned char>(s_[2]) == 0xBF) {
      i_ = 3;
    }
  }

  Value parse_document() {
    Value v = parse_value();
    skip_ws();
    if (i_ != s_.size()) fail("trailing characters after JSON value");
    return v;
  }

 private:
  const std::string& s_;
  std::size_t i_{0};

  char peek() const { return i_ < s_.size() ? s_[i_] : '\0'; }
  char get() { return i_ < s_.size() ? s_[i_++] : '\0'; }

  void skip_ws() {
    while (i_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[i_]))) ++i_;
  }

  [[noreturn]] void fail(const std::string& msg) const {
    const std::size_t pos = std::min(i_, s_.size());
    int line = 1;
    int col = 1;
    std::size_t line_start = 0;
    for (std::size_t k = 0; k < pos; ++k) {
      if (s_[k] == '\n') {
        ++line;
        col = 1;
        line_start = k + 1;
      } else if (s_[k] != '\r') {
        ++col;
      }
    }
    std::size_t line_end = line_start;
    while (line_end < s_.size() && s_[line_end] != '\n' && s_[line_end] != '\r') ++line_end;

    std::ostringstream ss;
    ss << "JSON parse error (line " << line << ", col " << col << "): " << msg;
    if (line_end > line_start && line_end - line_start <= 160) {
      ss << "\n" << s_.substr(line_start, line_end - line_start) << "\n"
         << std::string(pos - line_start, ' ') << "^";
    }
    throw std::runtime_error(ss.str());
  }

  void expect(char c) {
    skip_ws();
    if (peek() != c) fail(std::string("expected '") + c + "'");
    ++i_;
  }

  bool consume(char c) {
    skip_ws();
    if (peek() != c) return false;
    ++i_;
    return true;
  }

  Value parse_value() {
    skip_ws();
    switch (peek()) {
      case 'n': return parse_literal("null", nullptr);
      case 't': return parse_literal("true", true);
      case 'f': return parse_literal("false", false);
      case '"': return parse_string();
      case '[': return parse_array();
      case '{': return parse_object();
      default: break;
    }
    if (peek() == '-' || std::isdigit(static_cast<unsigned char>(peek()))) return parse_number();
    fail("unexpected character");
  }

  Value parse_literal(const char* lit, Value v) {
    for (const char* p = lit; *p; ++p) {
      if (get() != *p) fail("invalid literal");
    }
    return v;
  }

  void digits() {
    if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
    while (std::isdigit(static_cast<unsigned char>(peek()))) ++i_;
  }

  Value parse_number() {
    const std::size_t start = i_;
    if (peek() == '-') ++i_;
    digits();
    if (peek() == '.') {
      ++i_;
      digits();
    }
    if (peek() == 'e' || peek() == 'E') {
      ++i_;
      if (peek() == '+' || peek() == '-') ++i_;
      digits();
    }
    const double d = std::strtod(s_.c_str() + start, nullptr);
    if (!std::isfinite(d)) fail("number out of range");
    return d;
  }

  unsigned hex4() {
    unsigned code = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = get();
      code <<= 4;
      if (h >= '0' && h <= '9') {
        code += static_cast<unsigned>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code += static_cast<unsigned>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code += static_cast<unsigned>(h - 'A' + 10);
      } else {
        fail("bad unicode escape");
      }
    }
    return code;
  }

  static void append_utf8(std::uint32_t cp, std::string& out) {
    if (cp <= 0x7F) {
      out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  std::string parse_raw_string() {
    expect('"');
    std::string out;
    while (true) {
      if (i_ >= s_.size()) fail("unterminated string");
      const char c = get();
      if (c == '"') break;
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      const char e = get();
      switch (e) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/': out.push_back('/'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': {
          std::uint32_t cp = hex4();
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (get() != '\\' || get() != 'u') fail("expected low surrogate");
            const unsigned lo = hex4();
            if (lo < 0xDC00 || lo > 0xDFFF) fail("invalid low surrogate");
            cp = 0x10000u + (((cp - 0xD800u) << 10u) | (lo - 0xDC00u));
          } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
            fail("unexpected low surrogate");
          }
          append_utf8(cp, out);
          break;
        }
        default: fail("unknown escape");
      }
    }
    return out;
  }

  Value parse_string() { return parse_raw_string(); }

  Value parse_array() {
    expect('[');
    Array arr;
    if (consume(']')) return arr;
    while (true) {
      arr.push_back(parse_value());
      if (consume(']')) break;
      expect(',');
    }
    return arr;
  }

  Value parse_object() {
    expect('{');
    Object obj;
    if (consume('}')) return obj;
    while (true) {
      skip_ws();
      if (peek() != '"') fail("expected string key");
      std::string key = parse_raw_string();
      expect(':');
      obj[std::move(key)] = parse_value();
      if (consume('}')) break;
      expect(',');
    }
    return obj;
  }
};

void write_escaped(const std::string& in, std::ostringstream& out) {
  out << '"';
  for (const char c : in) {
    switch (c) {
      case '"': out << "\\\""; break;
      case '\\': out << "\\\\"; break;
      case '\n': out << "\\n"; break;
      case '\r': out << "\\r"; break;
      case '\t': out << "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out << buf;
        } else {
          out << c;
        }
    }
  }
  out << '"';
}

void write_value(const Value& v, std::ostringstream& out, int indent, int depth) {
  const auto newline = [&](int d) {
    if (indent <= 0) return;
    out << '\n' << std::string(static_cast<std::size_t>(d * indent), ' ');
  };

  if (v.is_null()) {
    out << "null";
  } else if (const bool* b = v.as_bool()) {
    out << (*b ? "true" : "false");
  } else if (const double* d = v.as_number()) {
    if (std::fabs(*d - std::round(*d)) < 1e-9 && std::fabs(*d) < 9.0e15) {
      out << static_cast<std::int64_t>(std::llround(*d));
    } else {
      char buf[32];
      std::snprintf(buf, sizeof(buf), "%.17g", *d);
      out << buf;
    }
  } else if (const std::string* s = v.as_string()) {
    write_escaped(*s, out);
  } else if (const Array* a = v.as_array()) {
    out << '[';
    for (std::size_t k = 0; k < a->size(); ++k) {
      if (k > 0) out << ',';
      newline(depth + 1);
      write_value((*a)[k], out, indent, depth + 1);
    }
    if (!a->empty()) newline(depth);
    out << ']';
  } else {
    const Object& o = v.object();
    // Object is unordered; sort keys so output is stable across runs.
    std::vector<const std::string*> keys;
    keys.reserve(o.size());
    for (const auto& [k, _] : o) keys.push_back(&k);
    std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) { return *a < *b; });

    out << '{';
    for (std::size_t k = 0; k < keys.size(); ++k) {
      if (k > 0) out << ',';
      newline(depth + 1);
      write_escaped(*keys[k], out);
      out << (indent > 0 ? ": " : ":");
      write_value(o.at(*keys[k]), out, indent, depth + 1);
    }
    if (!keys.empty()) newline(depth);
    out << '}';
  }
}

} // namespace

bool Value::is_null() const { return std::holds_alternative<std::nullptr_t>(*this); }
bool Value::is_bool() const { return std::holds_alternative<bool>(*this); }
bool Value::is_number() const { return std::holds_alternative<double>(*this); }
bool Value::is_string() const { return std::holds_alternative<std::string>(*this); }
bool Value::is_array() const { return std::holds_alternative<Array>(*this); }
bool Value::is_object() const { return std::holds_alternative<Object>(*this); }

const bool* Value::as_bool() const { return std::get_if<bool>(this); }
const double* Value::as_number() const { return std::get_if<double>(this); }
const std::string* Value::as_string() const { return std::get_if<std::string>(this); }
const Array* Value::as_array() const { return std::get_if<Array>(this); }
const Object* Value::as_object() const { return std::get_if<Object>(this); }

Array* Value::as_array() { return std::get_if<Array>(this); }
Object* Value::as_object() { return std::get_if<Object>(this); }

const Value& Value::at(const std::string& key) const {
  const Value* v = find(key);
  if (!v) {
    if (!is_object()) throw std::runtime_error("JSON value is not an object");
    throw std::runtime_error("JSON object missing key: " + key);
  }
  return *v;
}

const Value* Value::find(const std::string& key) const {
  const auto* o = as_object();
  if (!o) return nullptr;
  auto it = o->find(key);
  return it == o->end() ? nullptr : &it->second;
}

bool Value::bool_value(bool def) const {
  if (const auto* p = as_bool()) return *p;
  return def;
}

double Value::number_value(double def) const {
  if (const auto* p = as_number()) return *p;
  return def;
}

std::int64_t Value::int_value(std::int64_t def) const {
  if (const auto* p = as_number()) return static_cast<std::int64_t>(*p);
  return def;
}

std::string Value::string_value(const std::string& def) const {
  if (const auto* p = as_string()) return *p;
  return def;
}

const Object& Value::object() const {
  const auto* o = as_object();
  if (!o) throw std::runtime_error("JSON value is not an object");
  return *o;
}

const Array& Value::array() const {
  const auto* a = as_array();
  if (!a) throw std::runtime_error("JSON value is not an array");
  return *a;
}

Value parse(const std::string& text) {
  Parser p(text);
  return p.parse_document();
}

std::string stringify(const Value& v, int indent) {
  std::ostringstream out;
  write_value(v, out, indent, 0);
  return out.str();
}

Value object(Object o) { return Value(std::move(o)); }
Value array(Array a) { return Value(std::move(a)); }

} // namespace resflow::json
