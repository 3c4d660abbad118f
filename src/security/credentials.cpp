#include "codebox/security/credentials.hpp"

#include "codebox/common/fs.hpp"

#include <algorithm>
#include <iomanip>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <sstream>
#include <vector>

namespace codebox::security {

namespace {

std::string to_hex(const unsigned char *data, const std::size_t size) {
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < size; ++i) {
    stream << std::setw(2) << static_cast<int>(data[i]);
  }
  return stream.str();
}

} // namespace

common::Result<std::string> random_hex(const std::size_t bytes) {
  std::vector<unsigned char> data(bytes);
  if (RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    return common::Result<std::string>::failure("RAND_bytes failed");
  }
  return common::Result<std::string>::success(to_hex(data.data(), data.size()));
}

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);
  return to_hex(digest, sizeof(digest));
}

bool constant_time_equals(const std::string &a, const std::string &b) {
  const auto hash_a = sha256_hex(a);
  const auto hash_b = sha256_hex(b);

  const std::size_t max_size = std::max(hash_a.size(), hash_b.size());
  auto diff = static_cast<unsigned char>(hash_a.size() ^ hash_b.size());

  for (std::size_t i = 0; i < max_size; ++i) {
    const unsigned char lhs = i < hash_a.size() ? static_cast<unsigned char>(hash_a[i]) : 0;
    const unsigned char rhs = i < hash_b.size() ? static_cast<unsigned char>(hash_b[i]) : 0;
    diff |= static_cast<unsigned char>(lhs ^ rhs);
  }

  return diff == 0;
}

std::optional<std::string> parse_bearer_token(const std::string &header_value) {
  const std::string value = common::trim(header_value);
  const auto space = value.find(' ');
  if (space == std::string::npos) {
    return std::nullopt;
  }
  if (common::to_lower(value.substr(0, space)) != "bearer") {
    return std::nullopt;
  }
  std::string token = common::trim(value.substr(space + 1));
  if (token.empty()) {
    return std::nullopt;
  }
  return token;
}

} // namespace codebox::security
