#include "docsync/jsonlite.hpp"

// Architecture notes on jsonlite:
//
// DETERMINISM GUARANTEES:
//   - to_json() returns a canonical form with sorted keys (std::map iteration).
//   - format_double() always uses 6 decimal places with trailing-zero trimming.
//   - No locale dependency in any writer.
//
// DETERMINISM RISKS:
//   - std::strtod() is locale-sensitive. It is used only for input parsing,
//     never for canonical output. Evidence packs carry no floating-point
//     fields, so doubles never reach a hashed byte string in practice.
//
// UNTRUSTED INPUT:
//   Packs and redaction responses are parsed with the same strict parser.
//   Depth is bounded (kMaxDepth) so adversarial nesting cannot exhaust the
//   stack.

#include <cctype>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace docsync::jsonlite {

namespace {

constexpr char kHexChars[] = "0123456789abcdef";
constexpr std::uint32_t kReplacementChar = 0xFFFD;

void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

void append_u_escape(std::string& out, std::uint32_t unit) {
  out += "\\u";
  out += kHexChars[(unit >> 12) & 0xF];
  out += kHexChars[(unit >> 8) & 0xF];
  out += kHexChars[(unit >> 4) & 0xF];
  out += kHexChars[unit & 0xF];
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Byte length of the well-formed UTF-8 sequence at s[i], or 0 if it is not
// well formed. A literal U+FFFD is well formed.
size_t utf8_sequence_length(const std::string& s, size_t i) {
  size_t j = i;
  const std::uint32_t cp = next_code_point(s, j);
  if (cp == kReplacementChar && !(j - i == 3 && s.compare(i, 3, "\xEF\xBF\xBD") == 0)) return 0;
  return j - i;
}

struct Parser {
  const std::string& s;
  size_t i{0};
  size_t depth{0};
  std::optional<JsonError> err;

  void ws() { while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\n' || s[i] == '\r')) ++i; }
  bool eat(char c) { ws(); if (i < s.size() && s[i] == c) { ++i; return true; } return false; }
  void fail(const std::string& message) { if (!err) err = JsonError{"json_parse_error", message}; }

  bool read_hex4(std::uint32_t& out) {
    if (i + 4 > s.size()) { fail("truncated \\u escape"); return false; }
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const int h = hex_value(s[i++]);
      if (h < 0) { fail("invalid \\u escape"); return false; }
      out = (out << 4) | static_cast<std::uint32_t>(h);
    }
    return true;
  }

  std::string parse_string() {
    if (!eat('"')) { fail("expected string"); return {}; }
    std::string o;
    while (i < s.size()) {
      const char c = s[i++];
      if (c == '"') return o;
      if (static_cast<unsigned char>(c) < 0x20) { fail("control character in string"); return {}; }
      if (static_cast<unsigned char>(c) >= 0x80) {
        const size_t len = utf8_sequence_length(s, i - 1);
        if (len == 0) { fail("invalid UTF-8 in string"); return {}; }
        o.append(s, i - 1, len);
        i += len - 1;
        continue;
      }
      if (c != '\\') { o += c; continue; }
      if (i >= s.size()) break;
      const char n = s[i++];
      switch (n) {
        case '"':  o += '"'; break;
        case '\\': o += '\\'; break;
        case '/':  o += '/'; break;
        case 'b':  o += '\b'; break;
        case 'f':  o += '\f'; break;
        case 'n':  o += '\n'; break;
        case 'r':  o += '\r'; break;
        case 't':  o += '\t'; break;
        case 'u': {
          std::uint32_t unit = 0;
          if (!read_hex4(unit)) return {};
          if (unit >= 0xDC00 && unit <= 0xDFFF) { fail("lone low surrogate in \\u escape"); return {}; }
          if (unit >= 0xD800 && unit <= 0xDBFF) {
            std::uint32_t low = 0;
            if (i + 1 >= s.size() || s[i] != '\\' || s[i + 1] != 'u') {
              fail("lone high surrogate in \\u escape");
              return {};
            }
            i += 2;
            if (!read_hex4(low)) return {};
            if (low < 0xDC00 || low > 0xDFFF) { fail("lone high surrogate in \\u escape"); return {}; }
            unit = 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00);
          }
          append_utf8(o, unit);
          break;
        }
        default:
          fail("invalid escape sequence");
          return {};
      }
    }
    fail("unterminated string");
    return {};
  }

  bool parse_number(Value& out_val) {
    ws();
    const size_t start = i;

    if (s.compare(i, 3, "NaN") == 0 || s.compare(i, 8, "Infinity") == 0 || s.compare(i, 9, "-Infinity") == 0) {
      fail("NaN/Infinity unsupported");
      return false;
    }

    if (i < s.size() && s[i] == '-') ++i;
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
      return false;
    }
    if (s[i] == '0' && i + 1 < s.size() && std::isdigit(static_cast<unsigned char>(s[i + 1]))) {
      fail("leading zero in number");
      return false;
    }
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;

    bool has_frac = false;
    if (i < s.size() && s[i] == '.') {
      has_frac = true;
      ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        fail("invalid number format");
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }

    bool has_exp = false;
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      has_exp = true;
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        fail("invalid exponent");
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }

    const std::string num_str = s.substr(start, i - start);

    // Non-negative integers are kept exact as u64; everything else is a double.
    if (!has_frac && !has_exp && num_str[0] != '-') {
      std::uint64_t n = 0;
      const auto [ptr, ec] = std::from_chars(num_str.data(), num_str.data() + num_str.size(), n);
      if (ec == std::errc() && ptr == num_str.data() + num_str.size()) {
        out_val = Value{n};
        return true;
      }
    }
    char* end = nullptr;
    const double d = std::strtod(num_str.c_str(), &end);
    if (end != num_str.c_str() + num_str.size()) {
      fail("invalid number");
      return false;
    }
    out_val = Value{d};
    return true;
  }

  Value parse_value() {
    ws();
    if (i >= s.size()) { fail("unexpected eof"); return {}; }
    if (s[i] == '{' || s[i] == '[') {
      if (++depth > kMaxDepth) { fail("nesting too deep"); return {}; }
      Value out = s[i] == '{' ? Value{parse_object()} : Value{parse_array()};
      --depth;
      return out;
    }
    if (s[i] == '"') return Value{parse_string()};
    if (s.compare(i, 4, "true") == 0) { i += 4; return Value{true}; }
    if (s.compare(i, 5, "false") == 0) { i += 5; return Value{false}; }
    if (s.compare(i, 4, "null") == 0) { i += 4; return Value{nullptr}; }
    Value num_val;
    if (parse_number(num_val)) {
      return num_val;
    }
    fail("unexpected token");
    return {};
  }

  Object parse_object() {
    Object out;
    eat('{');
    ws();
    if (eat('}')) return out;
    while (!err) {
      auto k = parse_string();
      if (err) break;
      if (out.contains(k)) { err = JsonError{"json_duplicate_key", "duplicate key: " + k}; break; }
      if (!eat(':')) { fail("expected :"); break; }
      out[k] = parse_value();
      if (err) break;
      if (eat('}')) break;
      if (!eat(',')) { fail("expected ,"); break; }
    }
    return out;
  }

  Array parse_array() {
    Array out;
    eat('[');
    ws();
    if (eat(']')) return out;
    while (!err) {
      out.push_back(parse_value());
      if (err) break;
      if (eat(']')) break;
      if (!eat(',')) { fail("expected ,"); break; }
    }
    return out;
  }

  Value parse_document() {
    Value v = parse_value();
    ws();
    if (!err && i != s.size()) fail("trailing data");
    return v;
  }
};

// Escape for UTF-8 passthrough output. Fast path returns the input untouched
// when no character needs escaping.
std::string escape_inner(const std::string& s) {
  bool needs_escape = false;
  for (unsigned char c : s) {
    if (c == '"' || c == '\\' || c < 0x20 || c >= 0x80) {
      needs_escape = true;
      break;
    }
  }
  if (!needs_escape) return s;

  std::string o;
  o.reserve(s.size() + s.size() / 4 + 4);
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '"')        o += "\\\"";
    else if (c == '\\')  o += "\\\\";
    else if (c == '\b')  o += "\\b";
    else if (c == '\f')  o += "\\f";
    else if (c == '\n')  o += "\\n";
    else if (c == '\r')  o += "\\r";
    else if (c == '\t')  o += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) append_u_escape(o, static_cast<unsigned char>(c));
    else if (static_cast<unsigned char>(c) < 0x80) o += c;
    else if (const size_t len = utf8_sequence_length(s, i); len == 0) append_u_escape(o, kReplacementChar);
    else {
      o.append(s, i, len);
      i += len - 1;
    }
  }
  return o;
}

// Escape for the canonical ASCII form.
std::string escape_ascii(const std::string& s) {
  std::string o;
  o.reserve(s.size() + 8);
  size_t i = 0;
  while (i < s.size()) {
    const std::uint32_t cp = next_code_point(s, i);
    switch (cp) {
      case '"':  o += "\\\""; continue;
      case '\\': o += "\\\\"; continue;
      case '\b': o += "\\b"; continue;
      case '\f': o += "\\f"; continue;
      case '\n': o += "\\n"; continue;
      case '\r': o += "\\r"; continue;
      case '\t': o += "\\t"; continue;
      default: break;
    }
    if (cp >= 0x20 && cp < 0x7F) {
      o += static_cast<char>(cp);
    } else if (cp > 0xFFFF) {
      const std::uint32_t v = cp - 0x10000;
      append_u_escape(o, 0xD800 | (v >> 10));
      append_u_escape(o, 0xDC00 | (v & 0x3FF));
    } else {
      append_u_escape(o, cp);
    }
  }
  return o;
}

std::string format_double(double d) {
  char buf[64];
  int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
  std::string result(buf, static_cast<size_t>(n));
  while (!result.empty() && result.back() == '0') result.pop_back();
  if (!result.empty() && result.back() == '.') result.push_back('0');
  return result;
}

struct WriteStyle {
  const char* item_sep;
  const char* key_sep;
  bool ascii;
};

constexpr WriteStyle kCanonical{",", ":", true};
constexpr WriteStyle kLegacy{", ", ": ", true};

void write_compact(std::ostringstream& oss, const Value& v, const WriteStyle& style) {
  const auto quote = [&](const std::string& s) {
    oss << '"' << (style.ascii ? escape_ascii(s) : escape_inner(s)) << '"';
  };
  if (v.is_null()) { oss << "null"; return; }
  if (v.is_bool()) { oss << (std::get<bool>(v.v) ? "true" : "false"); return; }
  if (v.is_string()) { quote(std::get<std::string>(v.v)); return; }
  if (v.is_u64()) { oss << std::get<std::uint64_t>(v.v); return; }
  if (v.is_double()) { oss << format_double(std::get<double>(v.v)); return; }
  if (v.is_object()) {
    oss << '{';
    bool first = true;
    for (const auto& [k, vv] : std::get<Object>(v.v)) {
      if (!first) oss << style.item_sep;
      first = false;
      quote(k);
      oss << style.key_sep;
      write_compact(oss, vv, style);
    }
    oss << '}';
    return;
  }
  oss << '[';
  bool first = true;
  for (const auto& vv : std::get<Array>(v.v)) {
    if (!first) oss << style.item_sep;
    first = false;
    write_compact(oss, vv, style);
  }
  oss << ']';
}

void write_pretty(std::ostringstream& oss, const Value& v, int indent, int level) {
  const std::string pad(static_cast<size_t>(indent * (level + 1)), ' ');
  const std::string close_pad(static_cast<size_t>(indent * level), ' ');
  if (v.is_object()) {
    const auto& obj = std::get<Object>(v.v);
    if (obj.empty()) { oss << "{}"; return; }
    oss << "{\n";
    bool first = true;
    for (const auto& [k, vv] : obj) {
      if (!first) oss << ",\n";
      first = false;
      oss << pad << '"' << escape_inner(k) << "\": ";
      write_pretty(oss, vv, indent, level + 1);
    }
    oss << '\n' << close_pad << '}';
    return;
  }
  if (v.is_array()) {
    const auto& arr = std::get<Array>(v.v);
    if (arr.empty()) { oss << "[]"; return; }
    oss << "[\n";
    bool first = true;
    for (const auto& vv : arr) {
      if (!first) oss << ",\n";
      first = false;
      oss << pad;
      write_pretty(oss, vv, indent, level + 1);
    }
    oss << '\n' << close_pad << ']';
    return;
  }
  write_compact(oss, v, WriteStyle{",", ":", false});
}

}  // namespace

std::uint32_t next_code_point(const std::string& s, std::size_t& i) {
  const auto byte = [&](size_t k) { return static_cast<unsigned char>(s[k]); };
  const unsigned char lead = byte(i);
  if (lead < 0x80) { ++i; return lead; }

  size_t len = 0;
  std::uint32_t cp = 0;
  std::uint32_t min = 0;
  if ((lead & 0xE0) == 0xC0) { len = 2; cp = lead & 0x1F; min = 0x80; }
  else if ((lead & 0xF0) == 0xE0) { len = 3; cp = lead & 0x0F; min = 0x800; }
  else if ((lead & 0xF8) == 0xF0) { len = 4; cp = lead & 0x07; min = 0x10000; }
  else { ++i; return kReplacementChar; }

  if (i + len > s.size()) { ++i; return kReplacementChar; }
  for (size_t k = 1; k < len; ++k) {
    const unsigned char c = byte(i + k);
    if ((c & 0xC0) != 0x80) { ++i; return kReplacementChar; }
    cp = (cp << 6) | (c & 0x3F);
  }
  // Overlong forms, UTF-16 surrogates and out-of-range values are invalid.
  if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) { ++i; return kReplacementChar; }
  i += len;
  return cp;
}

Value parse_value(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  Value v = p.parse_document();
  if (error) *error = p.err;
  if (p.err) return {};
  return v;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  Value v = p.parse_document();
  if (!p.err && !v.is_object()) p.err = JsonError{"json_parse_error", "root is not an object"};
  if (error) *error = p.err;
  if (p.err) return {};
  return std::get<Object>(std::move(v.v));
}

std::optional<JsonError> validate_strict(const std::string& text) {
  Parser p{text};
  (void)p.parse_document();
  return p.err;
}

std::string to_json(const Value& v) {
  std::ostringstream oss;
  write_compact(oss, v, kCanonical);
  return oss.str();
}

std::string to_json_legacy(const Value& v) {
  std::ostringstream oss;
  write_compact(oss, v, kLegacy);
  return oss.str();
}

std::string to_json_pretty(const Value& v, int indent) {
  std::ostringstream oss;
  write_pretty(oss, v, indent, 0);
  return oss.str();
}

std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  Value v = p.parse_document();
  if (error) *error = p.err;
  if (p.err) return {};
  return to_json(v);
}

std::string escape(const std::string& s) { return escape_inner(s); }

const Value* find(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : &it->second;
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const Value* v = find(obj, key);
  if (!v || !v->is_string()) return def;
  return std::get<std::string>(v->v);
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  const Value* v = find(obj, key);
  if (!v || !v->is_bool()) return def;
  return std::get<bool>(v->v);
}

unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  const Value* v = find(obj, key);
  if (!v || !v->is_u64()) return def;
  return std::get<std::uint64_t>(v->v);
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  const Value* v = find(obj, key);
  if (!v || !v->is_array()) return out;
  for (const auto& item : std::get<Array>(v->v)) {
    if (item.is_string()) {
      out.push_back(std::get<std::string>(item.v));
    }
  }
  return out;
}

}  // namespace docsync::jsonlite
