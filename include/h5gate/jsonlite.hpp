#pragma once

// h5gate/jsonlite.hpp — Minimal JSON value model, parser and writers.
//
// VALUE MODEL:
//   Value is a tagged variant over null, bool, unsigned integer, double,
//   string, object and array. Non-negative integers without fraction or
//   exponent parse as std::uint64_t; every other number parses as double.
//   Objects are std::map, so iteration (and therefore every writer) is sorted
//   by key.
//
// STRINGS:
//   Strings hold UTF-8 bytes. \uXXXX escapes forming a valid surrogate pair
//   decode to one supplementary code point; an unpaired surrogate escape is
//   kept as its 3-byte generalized-UTF-8 form, the same bytes the batch
//   protocol sends for it (see utf8.hpp).
//
// EQUALITY:
//   operator== is structural. Numbers compare by value across the uint64 and
//   double arms, so an engine reporting 2.0 matches an expected 2.

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace h5gate::jsonlite {

struct JsonError {
  std::string code;
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
  Value(std::uint64_t u) : v(u) {}
  Value(double d) : v(d) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(v); }
  bool is_bool() const { return std::holds_alternative<bool>(v); }
  bool is_uint() const { return std::holds_alternative<std::uint64_t>(v); }
  bool is_number() const {
    return std::holds_alternative<std::uint64_t>(v) || std::holds_alternative<double>(v);
  }
  bool is_string() const { return std::holds_alternative<std::string>(v); }
  bool is_object() const { return std::holds_alternative<Object>(v); }
  bool is_array() const { return std::holds_alternative<Array>(v); }

  const std::string& as_string() const { return std::get<std::string>(v); }
  const Object& as_object() const { return std::get<Object>(v); }
  const Array& as_array() const { return std::get<Array>(v); }
  std::uint64_t as_uint() const { return std::get<std::uint64_t>(v); }
  double as_double() const;
};

bool operator==(const Value& a, const Value& b);
bool operator!=(const Value& a, const Value& b);

// Parse any JSON value. Trailing non-whitespace is an error.
std::optional<Value> parse_value(const std::string& text, std::optional<JsonError>* error);

// Compact canonical form: no whitespace, sorted keys.
std::string to_json(const Value& v);

// Indented form: `indent` spaces per level, ": " key separator, sorted keys,
// empty containers as [] / {}. No trailing newline.
std::string to_json_pretty(const Value& v, int indent = 2);

std::string escape(const std::string& s);

// Rebuild v with fn applied to every string, including object keys. Numbers,
// booleans and null are copied unchanged.
Value transform_strings(const Value& v, const std::function<std::string(const std::string&)>& fn);

// Type-safe extractors
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
const Value* find(const Object& obj, const std::string& key);

}  // namespace h5gate::jsonlite
