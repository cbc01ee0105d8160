#pragma once

// docsync/jsonlite.hpp — Minimal strict JSON value model, parser and writers.
//
// DETERMINISM GUARANTEES:
//   - Object is a std::map, so every writer emits keys in sorted order.
//   - to_json() (canonical) uses minimal separators and ASCII-only output:
//     every code point outside 0x20..0x7e is written as \uXXXX (surrogate
//     pairs above the BMP, lowercase hex). Invalid UTF-8 bytes are written as
//     \ufffd. The function is total: any Value has exactly one canonical form.
//   - format_double() is locale-independent (snprintf "%.6f", trailing zeros
//     trimmed).
//
// STRICTNESS:
//   The parser rejects duplicate keys, trailing data, raw control characters in
//   strings, NaN/Infinity, malformed escapes, lone surrogate escapes, invalid
//   UTF-8 and nesting deeper than kMaxDepth, so distinct accepted inputs never
//   decode to the same Value. It never throws; failures are reported through
//   JsonError.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace docsync::jsonlite {

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key"
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(std::uint64_t n) : v(n) {}
  Value(double d) : v(d) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(v); }
  bool is_object() const { return std::holds_alternative<Object>(v); }
  bool is_array() const { return std::holds_alternative<Array>(v); }
  bool is_string() const { return std::holds_alternative<std::string>(v); }
  bool is_bool() const { return std::holds_alternative<bool>(v); }
  bool is_u64() const { return std::holds_alternative<std::uint64_t>(v); }
  bool is_double() const { return std::holds_alternative<double>(v); }

  bool operator==(const Value& other) const { return v == other.v; }
};

inline constexpr std::size_t kMaxDepth = 128;

// Parse any JSON value. On failure returns null and sets *error.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a JSON object. Returns {} (and sets *error) on failure or non-object root.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::optional<JsonError> validate_strict(const std::string& text);

// Canonical form used for hashing (sorted keys, "," and ":" separators, ASCII).
std::string to_json(const Value& v);

// Same ordering and escaping as to_json(), with ", " and ": " separators.
// Used only to recompute legacy (chain algorithm version 1) links.
std::string to_json_legacy(const Value& v);

// Human-readable form for files on disk. Valid UTF-8 passes through
// unescaped; invalid bytes are written as \ufffd, as in to_json().
std::string to_json_pretty(const Value& v, int indent = 2);

std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error);

// Escape for embedding in a JSON string literal (UTF-8 passthrough).
std::string escape(const std::string& s);

// Decode the code point starting at s[i] and advance i past it. Invalid or
// truncated sequences yield U+FFFD and advance by one byte.
std::uint32_t next_code_point(const std::string& s, std::size_t& i);

// Type-safe extractors
const Value* find(const Object& obj, const std::string& key);
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);

}  // namespace docsync::jsonlite
