#include "chaosmine/util/json.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace chaosmine::json {
namespace {

bool has_utf8_bom(const std::string& s) {
  return s.size() >= 3 && static_cast<unsigned char>(s[0]) == 0xEF && static_cast<unsigned char>(s[1]) == 0xBB &&
         static_cast<unsigned char>(s[2]) == 0xBF;
}

struct Parser {
  const std::string& s;
  std::size_t i{0};

  char peek() const { return i < s.size() ? s[i] : '\0'; }
  char get() { return i < s.size() ? s[i++] : '\0'; }

  void skip_ws() {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  }

  [[noreturn]] void fail(const std::string& msg) const {
    const std::size_t pos = std::min(i, s.size());

    // 1-based line/col; CRLF counts as one newline.
    std::size_t scan = has_utf8_bom(s) ? 3 : 0;
    std::size_t line_start = scan;
    int line = 1;
    int col = 1;
    while (scan < pos) {
      const char ch = s[scan];
      if (ch == '\n' || ch == '\r') {
        ++line;
        col = 1;
        scan += (ch == '\r' && scan + 1 < s.size() && s[scan + 1] == '\n') ? 2 : 1;
        line_start = scan;
        continue;
      }
      ++col;
      ++scan;
    }

    std::size_t line_end = line_start;
    while (line_end < s.size() && s[line_end] != '\n' && s[line_end] != '\r') ++line_end;

    constexpr std::size_t kMaxSnippet = 120;
    std::size_t snippet_start = line_start;
    if (pos > line_start + kMaxSnippet / 2) snippet_start = pos - kMaxSnippet / 2;
    const std::size_t snippet_end = std::min(line_end, snippet_start + kMaxSnippet);

    std::ostringstream ss;
    ss << "JSON parse error at " << i << " (line " << line << ", col " << col << "): " << msg;
    if (snippet_end > snippet_start) {
      ss << "\n" << s.substr(snippet_start, snippet_end - snippet_start) << "\n";
      ss << std::string(pos >= snippet_start ? pos - snippet_start : 0, ' ') << "^";
    }
    throw std::runtime_error(ss.str());
  }

  bool consume(char c) {
    skip_ws();
    if (peek() == c) {
      ++i;
      return true;
    }
    return false;
  }

  void expect(char c) {
    skip_ws();
    if (get() != c) fail(std::string("expected '") + c + "'");
  }

  unsigned parse_hex4() {
    if (i + 4 > s.size()) fail("bad unicode escape");
    unsigned code = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = get();
      code <<= 4;
      if (h >= '0' && h <= '9')
        code += static_cast<unsigned>(h - '0');
      else if (h >= 'a' && h <= 'f')
        code += static_cast<unsigned>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F')
        code += static_cast<unsigned>(h - 'A' + 10);
      else
        fail("bad unicode hex");
    }
    return code;
  }

  void append_utf8(std::uint32_t cp, std::string& out) {
    if (cp <= 0x7F) {
      out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
      out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
      out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0x10FFFF) {
      out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      fail("unicode codepoint out of range");
    }
  }

  Value parse_value() {
    skip_ws();
    const char c = peek();
    if (c == 'n') return parse_literal("null", nullptr);
    if (c == 't') return parse_literal("true", true);
    if (c == 'f') return parse_literal("false", false);
    if (c == '"') return parse_string();
    if (c == '[') return parse_array();
    if (c == '{') return parse_object();
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();
    fail("unexpected character");
  }

  Value parse_literal(const std::string& lit, Value v) {
    for (char c : lit) {
      if (get() != c) fail("invalid literal");
    }
    return v;
  }

  Value parse_number() {
    skip_ws();
    const std::size_t start = i;
    bool integral = true;
    if (peek() == '-') ++i;
    if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
    if (peek() == '0') {
      ++i;
    } else {
      while (std::isdigit(static_cast<unsigned char>(peek()))) ++i;
    }
    if (peek() == '.') {
      integral = false;
      ++i;
      if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number fraction");
      while (std::isdigit(static_cast<unsigned char>(peek()))) ++i;
    }
    if (peek() == 'e' || peek() == 'E') {
      integral = false;
      ++i;
      if (peek() == '+' || peek() == '-') ++i;
      if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid exponent");
      while (std::isdigit(static_cast<unsigned char>(peek()))) ++i;
    }
    const std::string num = s.substr(start, i - start);
    if (integral) {
      errno = 0;
      char* end = nullptr;
      const long long v = std::strtoll(num.c_str(), &end, 10);
      if (errno == 0 && end && *end == '\0') return static_cast<std::int64_t>(v);
      // Out of int64 range: fall through to double.
    }
    try {
      return std::stod(num);
    } catch (const std::exception&) {
      fail("failed to parse number");
    }
  }

  Value parse_string() {
    expect('"');
    std::string out;
    while (true) {
      if (i >= s.size()) fail("unterminated string");
      const char c = get();
      if (c == '"') break;
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (i >= s.size()) fail("bad escape");
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
          const unsigned hi = parse_hex4();
          if (hi >= 0xD800 && hi <= 0xDBFF) {
            if (get() != '\\' || get() != 'u') fail("expected low surrogate");
            const unsigned lo = parse_hex4();
            if (lo < 0xDC00 || lo > 0xDFFF) fail("invalid low surrogate");
            append_utf8(0x10000u + (((hi - 0xD800u) << 10u) | (lo - 0xDC00u)), out);
          } else if (hi >= 0xDC00 && hi <= 0xDFFF) {
            fail("unexpected low surrogate");
          } else {
            append_utf8(static_cast<std::uint32_t>(hi), out);
          }
          break;
        }
        default: fail("unknown escape");
      }
    }
    return out;
  }

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
      const std::string key = std::get<std::string>(parse_string());
      expect(':');
      obj[key] = parse_value();
      if (consume('}')) break;
      expect(',');
    }
    return obj;
  }
};

std::string escape_string(const std::string& in) {
  std::ostringstream ss;
  ss << '"';
  for (char c : in) {
    switch (c) {
      case '"': ss << "\\\""; break;
      case '\\': ss << "\\\\"; break;
      case '\n': ss << "\\n"; break;
      case '\r': ss << "\\r"; break;
      case '\t': ss << "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          ss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(static_cast<unsigned char>(c))
             << std::dec;
        } else {
          ss << c;
        }
    }
  }
  ss << '"';
  return ss.str();
}

void stringify_impl(const Value& v, std::ostringstream& out, int indent, int depth) {
  const auto pad = [&](int d) {
    for (int k = 0; k < d * indent; ++k) out << ' ';
  };

  if (v.is_null()) {
    out << "null";
  } else if (const auto* b = v.as_bool()) {
    out << (*b ? "true" : "false");
  } else if (const auto* n = v.as_integer()) {
    out << *n;
  } else if (const auto* d = v.as_double()) {
    out << std::setprecision(17) << *d;
  } else if (const auto* str = v.as_string()) {
    out << escape_string(*str);
  } else if (const auto* a = v.as_array()) {
    out << '[';
    if (!a->empty()) {
      if (indent > 0) out << '\n';
      for (std::size_t i = 0; i < a->size(); ++i) {
        if (indent > 0) pad(depth + 1);
        stringify_impl((*a)[i], out, indent, depth + 1);
        if (i + 1 < a->size()) out << ',';
        if (indent > 0) out << '\n';
      }
      if (indent > 0) pad(depth);
    }
    out << ']';
  } else {
    const auto& o = v.object();
    out << '{';
    if (!o.empty()) {
      if (indent > 0) out << '\n';

      // Deterministic output: sort keys (Object is an unordered_map).
      std::vector<std::string> keys;
      keys.reserve(o.size());
      for (const auto& [k, _] : o) keys.push_back(k);
      std::sort(keys.begin(), keys.end());

      for (std::size_t n = 0; n < keys.size(); ++n) {
        if (indent > 0) pad(depth + 1);
        out << escape_string(keys[n]) << ':';
        if (indent > 0) out << ' ';
        stringify_impl(o.at(keys[n]), out, indent, depth + 1);
        if (n + 1 < keys.size()) out << ',';
        if (indent > 0) out << '\n';
      }
      if (indent > 0) pad(depth);
    }
    out << '}';
  }
}

} // namespace

bool Value::is_null() const { return std::holds_alternative<std::nullptr_t>(*this); }
bool Value::is_bool() const { return std::holds_alternative<bool>(*this); }
bool Value::is_integer() const { return std::holds_alternative<std::int64_t>(*this); }
bool Value::is_number() const { return is_integer() || std::holds_alternative<double>(*this); }
bool Value::is_string() const { return std::holds_alternative<std::string>(*this); }
bool Value::is_array() const { return std::holds_alternative<Array>(*this); }
bool Value::is_object() const { return std::holds_alternative<Object>(*this); }

const bool* Value::as_bool() const { return std::get_if<bool>(this); }
const std::int64_t* Value::as_integer() const { return std::get_if<std::int64_t>(this); }
const double* Value::as_double() const { return std::get_if<double>(this); }
const std::string* Value::as_string() const { return std::get_if<std::string>(this); }
const Array* Value::as_array() const { return std::get_if<Array>(this); }
const Object* Value::as_object() const { return std::get_if<Object>(this); }

Array* Value::as_array() { return std::get_if<Array>(this); }
Object* Value::as_object() { return std::get_if<Object>(this); }

const Value& Value::at(const std::string& key) const {
  const auto* o = as_object();
  if (!o) throw std::runtime_error("JSON value is not an object");
  auto it = o->find(key);
  if (it == o->end()) throw std::runtime_error("JSON object missing key: " + key);
  return it->second;
}

const Value& Value::at(std::size_t index) const {
  const auto* a = as_array();
  if (!a) throw std::runtime_error("JSON value is not an array");
  if (index >= a->size()) throw std::runtime_error("JSON array index out of range");
  return (*a)[index];
}

const Value* Value::find(const std::string& key) const {
  const auto* o = as_object();
  if (!o) return nullptr;
  auto it = o->find(key);
  return it == o->end() ? nullptr : &it->second;
}

bool Value::bool_value(bool def) const {
  if (auto p = as_bool()) return *p;
  return def;
}

double Value::number_value(double def) const {
  if (auto p = as_integer()) return static_cast<double>(*p);
  if (auto p = as_double()) return *p;
  return def;
}

std::int64_t Value::int_value(std::int64_t def) const {
  if (auto p = as_integer()) return *p;
  if (auto p = as_double()) return static_cast<std::int64_t>(*p);
  return def;
}

std::string Value::string_value(const std::string& def) const {
  if (auto p = as_string()) return *p;
  return def;
}

std::uint64_t Value::uint_value() const {
  const auto* p = as_integer();
  if (!p) throw std::runtime_error("JSON value is not an integer");
  if (*p < 0) throw std::runtime_error("JSON integer must be non-negative");
  return static_cast<std::uint64_t>(*p);
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
  Parser p{text};

  // Be tolerant of files saved with a UTF-8 BOM.
  if (has_utf8_bom(text)) p.i = 3;

  Value v = p.parse_value();
  p.skip_ws();
  if (p.i != text.size()) p.fail("trailing characters after JSON");
  return v;
}

std::string stringify(const Value& v, int indent) {
  std::ostringstream out;
  stringify_impl(v, out, indent, 0);
  return out.str();
}

Value object(Object o) { return Value(std::move(o)); }
Value array(Array a) { return Value(std::move(a)); }
Value integer(std::int64_t v) { return Value(v); }

} // namespace chaosmine::json
