#pragma once

// h5gate/utf8.hpp — Forgiving UTF-8 codec matching the engine's decoder.
//
// The engine decodes its base64 payloads with a forgiving UTF-8 decoder: any
// byte that does not start or continue a well-formed sequence is mapped to the
// private-use code point 0xEE000 + byte. Every string the harness compares
// against engine output is passed through the same encode/decode pair so a
// case never fails only because of how an invalid byte was represented.
//
// ENCODING DIRECTION (surrogate pass-through):
//   Code points are written as generalized UTF-8. Unpaired surrogates
//   (U+D800..U+DFFF) become their 3-byte form (ED A0 80 .. ED BF BF) instead of
//   being rejected. The forgiving decoder does not accept those bytes, so a
//   round-tripped surrogate comes back as three PUA code points. That loss is
//   intentional: it is exactly what the engine reports.
//
// INVARIANT:
//   encode_passthrough(decode_forgiving(b)) == b whenever decode_forgiving did
//   not classify any byte of b as invalid.

#include <string>
#include <string_view>

namespace h5gate {
namespace utf8 {

constexpr char32_t kInvalidByteBase = 0xEE000;
constexpr char32_t kReplacementChar = 0xFFFD;

// Append cp as generalized UTF-8. Surrogates pass through; values above
// U+10FFFF are written as U+FFFD.
void append_code_point(std::string& out, char32_t cp);

std::u32string decode_forgiving(std::string_view bytes);
std::string encode_passthrough(std::u32string_view code_points);

// decode_forgiving followed by encode_passthrough: the bytes the engine will
// see for a string the harness holds as UTF-8.
std::string forgiving_roundtrip(std::string_view bytes);

// Strict decode with U+FFFD substitution, one replacement per maximal invalid
// subpart. Used for reading fixture text files.
std::string to_valid_utf8(std::string_view bytes);

// One layer of backslash-escape decoding (tokenizer fixtures with
// "doubleEscaped": true). Recognized: \\ \' \" \a \b \f \n \r \t \v \xHH
// \uHHHH \UHHHHHHHH and up to three octal digits. \u escapes are decoded one
// at a time; a surrogate pair written as two escapes yields two unpaired
// surrogates. Unknown or truncated escapes are kept literally.
std::string decode_escapes(std::string_view text);

}  // namespace utf8
}  // namespace h5gate
