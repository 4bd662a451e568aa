#pragma once

#include <string>
#include <string_view>

namespace waypoint::util {

/*
  OpenSSL-backed digests and encodings.
*/

// Lowercase hex md5 of the input.
std::string Md5Hex(std::string_view data);

std::string Base64Encode(std::string_view data);

// Ignores embedded whitespace (postgres encode() wraps at 76 columns).
std::string Base64Decode(std::string_view text);

} // namespace waypoint::util
