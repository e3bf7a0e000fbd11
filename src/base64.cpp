#include "h5gate/base64.hpp"

#include <cstdint>

namespace h5gate {

namespace {

constexpr char kBase64Chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int sextet(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+') return 62;
  if (c == '/') return 63;
  return -1;
}

}  // namespace

std::string base64_encode(std::string_view bytes) {
  std::string out;
  out.reserve(4 * ((bytes.size() + 2) / 3));
  std::size_t i = 0;
  while (i + 3 <= bytes.size()) {
    const std::uint32_t triple = (static_cast<unsigned char>(bytes[i]) << 16) |
                                 (static_cast<unsigned char>(bytes[i + 1]) << 8) |
                                 static_cast<unsigned char>(bytes[i + 2]);
    out.push_back(kBase64Chars[(triple >> 18) & 0x3F]);
    out.push_back(kBase64Chars[(triple >> 12) & 0x3F]);
    out.push_back(kBase64Chars[(triple >> 6) & 0x3F]);
    out.push_back(kBase64Chars[triple & 0x3F]);
    i += 3;
  }
  const std::size_t rest = bytes.size() - i;
  if (rest == 1) {
    const std::uint32_t triple = static_cast<unsigned char>(bytes[i]) << 16;
    out.push_back(kBase64Chars[(triple >> 18) & 0x3F]);
    out.push_back(kBase64Chars[(triple >> 12) & 0x3F]);
    out += "==";
  } else if (rest == 2) {
    const std::uint32_t triple = (static_cast<unsigned char>(bytes[i]) << 16) |
                                 (static_cast<unsigned char>(bytes[i + 1]) << 8);
    out.push_back(kBase64Chars[(triple >> 18) & 0x3F]);
    out.push_back(kBase64Chars[(triple >> 12) & 0x3F]);
    out.push_back(kBase64Chars[(triple >> 6) & 0x3F]);
    out.push_back('=');
  }
  return out;
}

std::optional<std::string> base64_decode(std::string_view text) {
  if (text.size() % 4 != 0) return std::nullopt;
  std::string out;
  out.reserve(text.size() / 4 * 3);
  for (std::size_t i = 0; i < text.size(); i += 4) {
    const bool last = i + 4 == text.size();
    std::size_t pad = 0;
    if (last && text[i + 3] == '=') pad = text[i + 2] == '=' ? 2 : 1;
    std::uint32_t triple = 0;
    for (std::size_t k = 0; k < 4; ++k) {
      int v = 0;
      if (k >= 4 - pad) {
        v = 0;
      } else {
        v = sextet(text[i + k]);
        if (v < 0) return std::nullopt;
      }
      triple = (triple << 6) | static_cast<std::uint32_t>(v);
    }
    out.push_back(static_cast<char>((triple >> 16) & 0xFF));
    if (pad < 2) out.push_back(static_cast<char>((triple >> 8) & 0xFF));
    if (pad < 1) out.push_back(static_cast<char>(triple & 0xFF));
  }
  return out;
}

}  // namespace h5gate
