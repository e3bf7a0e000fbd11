#include "h5gate/utf8.hpp"

#include <cstdint>

namespace h5gate {
namespace utf8 {

namespace {

struct SequenceRule {
  std::size_t continuation_bytes{0};
  unsigned char second_lo{0x80};
  unsigned char second_hi{0xBF};
};

// Returns false when b0 cannot start a multi-byte sequence.
bool lead_byte_rule(unsigned char b0, SequenceRule& rule) {
  if (b0 >= 0xC2 && b0 <= 0xDF) {
    rule.continuation_bytes = 1;
    return true;
  }
  if (b0 >= 0xE0 && b0 <= 0xEF) {
    rule.continuation_bytes = 2;
    if (b0 == 0xE0) rule.second_lo = 0xA0;  // overlong
    if (b0 == 0xED) rule.second_hi = 0x9F;  // surrogates
    return true;
  }
  if (b0 >= 0xF0 && b0 <= 0xF4) {
    rule.continuation_bytes = 3;
    if (b0 == 0xF0) rule.second_lo = 0x90;  // overlong
    if (b0 == 0xF4) rule.second_hi = 0x8F;  // > U+10FFFF
    return true;
  }
  return false;
}

// Number of bytes after the lead byte that satisfy the rule, scanning at most
// rule.continuation_bytes.
std::size_t valid_continuations(std::string_view bytes, std::size_t i, const SequenceRule& rule) {
  std::size_t j = 1;
  for (; j <= rule.continuation_bytes; ++j) {
    if (i + j >= bytes.size()) break;
    const auto c = static_cast<unsigned char>(bytes[i + j]);
    const unsigned char lo = j == 1 ? rule.second_lo : 0x80;
    const unsigned char hi = j == 1 ? rule.second_hi : 0xBF;
    if (c < lo || c > hi) break;
  }
  return j - 1;
}

char32_t assemble(std::string_view bytes, std::size_t i, std::size_t continuation_bytes) {
  const auto b0 = static_cast<unsigned char>(bytes[i]);
  char32_t cp = 0;
  switch (continuation_bytes) {
    case 1: cp = b0 & 0x1F; break;
    case 2: cp = b0 & 0x0F; break;
    default: cp = b0 & 0x07; break;
  }
  for (std::size_t k = 1; k <= continuation_bytes; ++k) {
    cp = (cp << 6) | (static_cast<unsigned char>(bytes[i + k]) & 0x3F);
  }
  return cp;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Parses exactly `digits` hex characters at text[pos]. Returns false if any is
// missing or not a hex digit.
bool parse_hex(std::string_view text, std::size_t pos, std::size_t digits, std::uint32_t& out) {
  if (pos + digits > text.size()) return false;
  std::uint32_t v = 0;
  for (std::size_t k = 0; k < digits; ++k) {
    const int h = hex_value(text[pos + k]);
    if (h < 0) return false;
    v = (v << 4) | static_cast<std::uint32_t>(h);
  }
  out = v;
  return true;
}

}  // namespace

void append_code_point(std::string& out, char32_t cp) {
  if (cp > 0x10FFFF) cp = kReplacementChar;
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
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

std::u32string decode_forgiving(std::string_view bytes) {
  std::u32string out;
  out.reserve(bytes.size());
  std::size_t i = 0;
  while (i < bytes.size()) {
    const auto b0 = static_cast<unsigned char>(bytes[i]);
    if (b0 < 0x80) {
      out.push_back(b0);
      ++i;
      continue;
    }
    SequenceRule rule;
    if (lead_byte_rule(b0, rule) &&
        valid_continuations(bytes, i, rule) == rule.continuation_bytes) {
      out.push_back(assemble(bytes, i, rule.continuation_bytes));
      i += rule.continuation_bytes + 1;
      continue;
    }
    // Invalid lead byte or malformed sequence: remap this byte only.
    out.push_back(kInvalidByteBase + b0);
    ++i;
  }
  return out;
}

std::string encode_passthrough(std::u32string_view code_points) {
  std::string out;
  out.reserve(code_points.size());
  for (char32_t cp : code_points) append_code_point(out, cp);
  return out;
}

std::string forgiving_roundtrip(std::string_view bytes) {
  return encode_passthrough(decode_forgiving(bytes));
}

std::string to_valid_utf8(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size());
  std::size_t i = 0;
  while (i < bytes.size()) {
    const auto b0 = static_cast<unsigned char>(bytes[i]);
    if (b0 < 0x80) {
      out.push_back(static_cast<char>(b0));
      ++i;
      continue;
    }
    SequenceRule rule;
    if (!lead_byte_rule(b0, rule)) {
      append_code_point(out, kReplacementChar);
      ++i;
      continue;
    }
    const std::size_t good = valid_continuations(bytes, i, rule);
    if (good == rule.continuation_bytes) {
      out.append(bytes.substr(i, good + 1));
    } else {
      append_code_point(out, kReplacementChar);
    }
    i += good + 1;
  }
  return out;
}

std::string decode_escapes(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    const char c = text[i];
    if (c != '\\' || i + 1 >= text.size()) {
      out.push_back(c);
      ++i;
      continue;
    }
    const char n = text[i + 1];
    std::uint32_t v = 0;
    switch (n) {
      case '\\': out.push_back('\\'); i += 2; continue;
      case '\'': out.push_back('\''); i += 2; continue;
      case '"': out.push_back('"'); i += 2; continue;
      case 'a': out.push_back('\a'); i += 2; continue;
      case 'b': out.push_back('\b'); i += 2; continue;
      case 'f': out.push_back('\f'); i += 2; continue;
      case 'n': out.push_back('\n'); i += 2; continue;
      case 'r': out.push_back('\r'); i += 2; continue;
      case 't': out.push_back('\t'); i += 2; continue;
      case 'v': out.push_back('\v'); i += 2; continue;
      case 'x':
        if (parse_hex(text, i + 2, 2, v)) {
          append_code_point(out, v);
          i += 4;
          continue;
        }
        break;
      case 'u':
        if (parse_hex(text, i + 2, 4, v)) {
          append_code_point(out, v);
          i += 6;
          continue;
        }
        break;
      case 'U':
        if (parse_hex(text, i + 2, 8, v) && v <= 0x10FFFF) {
          append_code_point(out, v);
          i += 10;
          continue;
        }
        break;
      default:
        if (n >= '0' && n <= '7') {
          std::size_t k = i + 1;
          while (k < text.size() && k < i + 4 && text[k] >= '0' && text[k] <= '7') {
            v = (v << 3) | static_cast<std::uint32_t>(text[k] - '0');
            ++k;
          }
          append_code_point(out, v);
          i = k;
          continue;
        }
        break;
    }
    // Unknown or truncated escape: keep the backslash, continue after it.
    out.push_back('\\');
    ++i;
  }
  return out;
}

}  // namespace utf8
}  // namespace h5gate
