#pragma once

// warden/jsonlite.hpp: Strict JSON parser and canonical writer.
//
// DETERMINISM GUARANTEES:
//   - to_json() emits keys in sorted order (std::map iteration) with no
//     whitespace, so equal values always serialize to equal bytes.
//   - Doubles are written by format_double(): "%.6f" with trailing zeros
//     trimmed. Parsing that output and writing it again is byte-stable.
//   - Duplicate object keys and NaN/Infinity are rejected.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace warden::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array  = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(std::uint64_t u) : v(u) {}
  Value(double d) : v(d) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}

  bool is_object() const { return std::holds_alternative<Object>(v); }
  bool is_array() const { return std::holds_alternative<Array>(v); }
  bool is_string() const { return std::holds_alternative<std::string>(v); }
};

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key"
  std::string message;
};

// Parse any JSON value. On failure returns null and sets *error.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a JSON object. Returns an empty object if the text is not an object.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::optional<JsonError> validate_strict(const std::string& text);

// Canonical serialization.
std::string to_json(const Value& v);
std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error);
std::string format_double(double d);
std::string escape(const std::string& s);

// Type-safe extractors. Return `def` when the key is absent or mistyped.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);

// Nested access. Return nullptr when absent or mistyped.
const Object* get_object(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);

// True if key is present (any type, including null).
bool has_key(const Object& obj, const std::string& key);

}  // namespace warden::jsonlite
