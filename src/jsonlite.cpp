#include "h5gate/jsonlite.hpp"

// DETERMINISM:
//   - to_json()/to_json_pretty() iterate std::map, so output is key-sorted.
//   - format_double() uses snprintf("%.17g"), which is locale-independent for
//     digits and round-trips every IEEE 754 double.
//
// STRICTNESS:
//   - Duplicate object keys are rejected (json_duplicate_key).
//   - NaN/Infinity literals are rejected.
//   - Trailing data after the top-level value is rejected.

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

#include "h5gate/utf8.hpp"

namespace h5gate::jsonlite {

namespace {

int hex_digit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

struct Parser {
  const std::string& s;
  size_t i{0};
  std::optional<JsonError> err;

  void ws() { while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i; }
  bool eat(char c) { ws(); if (i < s.size() && s[i] == c) { ++i; return true; } return false; }

  bool read_hex4(char32_t& out) {
    if (i + 4 > s.size()) return false;
    char32_t v = 0;
    for (size_t k = 0; k < 4; ++k) {
      const int h = hex_digit(s[i + k]);
      if (h < 0) return false;
      v = (v << 4) | static_cast<char32_t>(h);
    }
    i += 4;
    out = v;
    return true;
  }

  std::string parse_string() {
    if (!eat('"')) {
      err = JsonError{"json_parse_error", "expected string"};
      return {};
    }
    std::string o;
    while (i < s.size()) {
      char c = s[i++];
      if (c == '"') return o;
      if (c != '\\') {
        o += c;
        continue;
      }
      if (i >= s.size()) break;
      char n = s[i++];
      if (n == 'n') o += '\n';
      else if (n == 't') o += '\t';
      else if (n == 'r') o += '\r';
      else if (n == 'b') o += '\b';
      else if (n == 'f') o += '\f';
      else if (n == 'u') {
        char32_t cp = 0;
        if (!read_hex4(cp)) {
          err = JsonError{"json_parse_error", "invalid \\u escape"};
          return {};
        }
        // Combine a high surrogate with an immediately following low one.
        if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < s.size() && s[i] == '\\' && s[i + 1] == 'u') {
          const size_t save = i;
          i += 2;
          char32_t lo = 0;
          if (read_hex4(lo) && lo >= 0xDC00 && lo <= 0xDFFF) {
            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
          } else {
            i = save;
          }
        }
        utf8::append_code_point(o, cp);
      } else {
        o += n;
      }
    }
    err = JsonError{"json_parse_error", "unterminated string"};
    return {};
  }

  bool parse_number(Value& out_val) {
    ws();
    size_t start = i;

    if (s.compare(i, 3, "NaN") == 0 || s.compare(i, 8, "Infinity") == 0 || s.compare(i, 9, "-Infinity") == 0) {
      err = JsonError{"json_parse_error", "NaN/Infinity unsupported"};
      return false;
    }

    if (i < s.size() && s[i] == '-') ++i;
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
      return false;
    }
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;

    bool has_frac = false;
    if (i < s.size() && s[i] == '.') {
      has_frac = true;
      ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        err = JsonError{"json_parse_error", "invalid number format"};
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
        err = JsonError{"json_parse_error", "invalid exponent"};
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }

    const std::string num_str = s.substr(start, i - start);
    // Negative and fractional numbers share the double arm; non-negative
    // integers that overflow uint64 fall back to it as well.
    if (!has_frac && !has_exp && num_str[0] != '-') {
      char* end = nullptr;
      errno = 0;
      const unsigned long long u = std::strtoull(num_str.c_str(), &end, 10);
      if (errno == 0 && end && *end == '\0') {
        out_val = Value{static_cast<std::uint64_t>(u)};
        return true;
      }
    }
    char* end = nullptr;
    const double d = std::strtod(num_str.c_str(), &end);
    if (!end || *end != '\0') {
      err = JsonError{"json_parse_error", "invalid number"};
      return false;
    }
    out_val = Value{d};
    return true;
  }

  Value parse_value() {
    ws();
    if (i >= s.size()) { err = JsonError{"json_parse_error", "unexpected eof"}; return {}; }
    if (s[i] == '{') return Value{parse_object()};
    if (s[i] == '[') return Value{parse_array()};
    if (s[i] == '"') return Value{parse_string()};
    if (s.compare(i, 4, "true") == 0) { i += 4; return Value{true}; }
    if (s.compare(i, 5, "false") == 0) { i += 5; return Value{false}; }
    if (s.compare(i, 4, "null") == 0) { i += 4; return Value{nullptr}; }
    Value num_val;
    if (parse_number(num_val)) {
      return num_val;
    }
    if (!err) err = JsonError{"json_parse_error", "unexpected token at offset " + std::to_string(i)};
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
      if (out.count(k) != 0) { err = JsonError{"json_duplicate_key", "duplicate key: " + k}; break; }
      if (!eat(':')) { err = JsonError{"json_parse_error", "expected :"}; break; }
      out[k] = parse_value();
      if (err) break;
      if (eat('}')) break;
      if (!eat(',')) { err = JsonError{"json_parse_error", "expected ,"}; break; }
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
      if (!eat(',')) { err = JsonError{"json_parse_error", "expected ,"}; break; }
    }
    return out;
  }
};

std::string escape_inner(const std::string& s) {
  bool needs_escape = false;
  for (unsigned char c : s) {
    if (c == '"' || c == '\\' || c < 0x20) {
      needs_escape = true;
      break;
    }
  }
  if (!needs_escape) return s;

  std::string o;
  o.reserve(s.size() + s.size() / 4 + 4);
  for (char c : s) {
    if (c == '"')        o += "\\\"";
    else if (c == '\\')  o += "\\\\";
    else if (c == '\b')  o += "\\b";
    else if (c == '\f')  o += "\\f";
    else if (c == '\n')  o += "\\n";
    else if (c == '\r')  o += "\\r";
    else if (c == '\t')  o += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
      o += buf;
    } else {
      o += c;
    }
  }
  return o;
}

std::string format_double(double d) {
  if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 1e15) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", d);
    return buf;
  }
  char buf[64];
  int n = std::snprintf(buf, sizeof(buf), "%.17g", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
  return std::string(buf, static_cast<size_t>(n));
}

std::string scalar_to_json(const Value& v) {
  if (v.is_null()) return "null";
  if (v.is_bool()) return std::get<bool>(v.v) ? "true" : "false";
  if (v.is_string()) return "\"" + escape_inner(v.as_string()) + "\"";
  if (v.is_uint()) return std::to_string(v.as_uint());
  return format_double(std::get<double>(v.v));
}

void write_pretty(std::ostringstream& oss, const Value& v, int indent, int depth) {
  const std::string pad(static_cast<size_t>(indent * (depth + 1)), ' ');
  const std::string close_pad(static_cast<size_t>(indent * depth), ' ');
  if (v.is_object()) {
    const auto& obj = v.as_object();
    if (obj.empty()) { oss << "{}"; return; }
    oss << "{\n";
    bool first = true;
    for (const auto& [k, vv] : obj) {
      if (!first) oss << ",\n";
      first = false;
      oss << pad << "\"" << escape_inner(k) << "\": ";
      write_pretty(oss, vv, indent, depth + 1);
    }
    oss << "\n" << close_pad << "}";
    return;
  }
  if (v.is_array()) {
    const auto& arr = v.as_array();
    if (arr.empty()) { oss << "[]"; return; }
    oss << "[\n";
    bool first = true;
    for (const auto& vv : arr) {
      if (!first) oss << ",\n";
      first = false;
      oss << pad;
      write_pretty(oss, vv, indent, depth + 1);
    }
    oss << "\n" << close_pad << "]";
    return;
  }
  oss << scalar_to_json(v);
}

}  // namespace

double Value::as_double() const {
  if (is_uint()) return static_cast<double>(as_uint());
  return std::get<double>(v);
}

bool operator==(const Value& a, const Value& b) {
  if (a.is_number() && b.is_number()) {
    if (a.is_uint() && b.is_uint()) return a.as_uint() == b.as_uint();
    return a.as_double() == b.as_double();
  }
  if (a.v.index() != b.v.index()) return false;
  if (a.is_null()) return true;
  if (a.is_bool()) return std::get<bool>(a.v) == std::get<bool>(b.v);
  if (a.is_string()) return a.as_string() == b.as_string();
  if (a.is_array()) {
    const auto& x = a.as_array();
    const auto& y = b.as_array();
    if (x.size() != y.size()) return false;
    for (size_t k = 0; k < x.size(); ++k) {
      if (!(x[k] == y[k])) return false;
    }
    return true;
  }
  const auto& x = a.as_object();
  const auto& y = b.as_object();
  if (x.size() != y.size()) return false;
  auto xi = x.begin();
  auto yi = y.begin();
  for (; xi != x.end(); ++xi, ++yi) {
    if (xi->first != yi->first || !(xi->second == yi->second)) return false;
  }
  return true;
}

bool operator!=(const Value& a, const Value& b) { return !(a == b); }

std::optional<Value> parse_value(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  auto v = p.parse_value();
  p.ws();
  if (!p.err && p.i != text.size()) p.err = JsonError{"json_parse_error", "trailing data"};
  if (error) *error = p.err;
  if (p.err) return std::nullopt;
  return v;
}

std::string to_json(const Value& v) {
  if (v.is_object()) {
    std::ostringstream oss; oss << "{"; bool first = true;
    for (const auto& [k, vv] : v.as_object()) { if (!first) oss << ","; first = false; oss << "\"" << escape_inner(k) << "\"" << ":" << to_json(vv); }
    oss << "}"; return oss.str();
  }
  if (v.is_array()) {
    std::ostringstream oss; oss << "["; bool first = true;
    for (const auto& vv : v.as_array()) { if (!first) oss << ","; first = false; oss << to_json(vv); }
    oss << "]"; return oss.str();
  }
  return scalar_to_json(v);
}

std::string to_json_pretty(const Value& v, int indent) {
  std::ostringstream oss;
  write_pretty(oss, v, indent, 0);
  return oss.str();
}

std::string escape(const std::string& s) { return escape_inner(s); }

Value transform_strings(const Value& v, const std::function<std::string(const std::string&)>& fn) {
  if (v.is_string()) return Value{fn(v.as_string())};
  if (v.is_array()) {
    Array out;
    out.reserve(v.as_array().size());
    for (const auto& item : v.as_array()) out.push_back(transform_strings(item, fn));
    return Value{std::move(out)};
  }
  if (v.is_object()) {
    Object out;
    for (const auto& [k, item] : v.as_object()) out[fn(k)] = transform_strings(item, fn);
    return Value{std::move(out)};
  }
  return v;
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->second.is_string()) return def;
  return it->second.as_string();
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->second.is_bool()) return def;
  return std::get<bool>(it->second.v);
}

const Value* find(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : &it->second;
}

}  // namespace h5gate::jsonlite
