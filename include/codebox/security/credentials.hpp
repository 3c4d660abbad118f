#pragma once

#include "codebox/common/result.hpp"

#include <optional>
#include <string>

namespace codebox::security {

/// Hex string of `bytes` random bytes from the OpenSSL CSPRNG.
[[nodiscard]] common::Result<std::string> random_hex(std::size_t bytes);

[[nodiscard]] std::string sha256_hex(const std::string &text);

/// Compares SHA-256 digests so the running time does not depend on where inputs differ.
[[nodiscard]] bool constant_time_equals(const std::string &a, const std::string &b);

/// Token from an `Authorization: Bearer <token>` value; nullopt for other schemes.
[[nodiscard]] std::optional<std::string> parse_bearer_token(const std::string &header_value);

} // namespace codebox::security
