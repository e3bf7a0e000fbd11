#pragma once

// h5gate/base64.hpp — RFC 4648 base64 (standard alphabet, '=' padding).

#include <optional>
#include <string>
#include <string_view>

namespace h5gate {

std::string base64_encode(std::string_view bytes);

// Strict decode: rejects characters outside the alphabet, bad padding and
// lengths that are not a multiple of four.
std::optional<std::string> base64_decode(std::string_view text);

}  // namespace h5gate
