#pragma once

#include <string>
#include <string_view>

namespace mountsync::util {

/*
  OpenSSL EVP digests rendered as hex.
*/

// Lowercase hex SHA-256, used to fingerprint descriptor content.
std::string Sha256Hex(std::string_view data);

} // namespace mountsync::util
