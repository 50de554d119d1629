#include "random.h"
#include <cstdlib>
#include "absl/strings/escaping.h"
#include "openssl/crypto.h"
#include "openssl/rand.h"

namespace authbridge {
namespace common {
namespace utilities {

Random::Random(const uint8_t *randomness, size_t len)
    : internal_buffer_(randomness, randomness + len) {}

bool Random::operator==(const Random &rhs) const {
  auto this_size = Size();
  if (this_size != rhs.Size()) {
    return false;
  }
  return CRYPTO_memcmp(internal_buffer_.data(), rhs.internal_buffer_.data(),
                       this_size) == 0;
}

bool Random::operator!=(const Random &rhs) const { return !(*this == rhs); }

size_t Random::Size() const { return internal_buffer_.size(); }

std::string Random::Str() const {
  return absl::WebSafeBase64Escape(
      absl::string_view(reinterpret_cast<const char *>(internal_buffer_.data()),
                        internal_buffer_.size()));
}

absl::optional<Random> Random::FromString(absl::string_view str) {
  std::string tmp;
  if (!absl::WebSafeBase64Unescape(str, &tmp)) {
    return absl::nullopt;
  }
  return Random(reinterpret_cast<const uint8_t *>(tmp.c_str()), tmp.size());
}

size_t Random::EncodedLength(size_t bytes) {
  // Unpadded base64: 4 characters per 3 bytes, plus 2 or 3 for a remainder.
  return (bytes * 8 + 5) / 6;
}

Random RandomGenerator::Generate(size_t sz) {
  // A broken entropy source is not something callers can recover from.
  std::vector<uint8_t> tmp(sz);
  if (RAND_bytes(tmp.data(), static_cast<int>(sz)) != 1) {
    abort();
  }
  return Random(tmp.data(), sz);
}

std::string RandomGenerator::GenerateString(size_t min_length) {
  size_t bytes = 0;
  while (Random::EncodedLength(bytes) < min_length) {
    bytes++;
  }
  return Generate(bytes).Str();
}

}  // namespace utilities
}  // namespace common
}  // namespace authbridge
