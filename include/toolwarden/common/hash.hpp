#pragma once

#include <string>

namespace toolwarden::common {

/// Lower-case hex SHA-256 digest.
[[nodiscard]] std::string sha256_hex(const std::string &text);

} // namespace toolwarden::common
