#ifndef AUTHBRIDGE_SRC_COMMON_UTILITIES_RANDOM_H_
#define AUTHBRIDGE_SRC_COMMON_UTILITIES_RANDOM_H_
#include <memory>
#include <string>
#include <vector>
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"

namespace authbridge {
namespace common {
namespace utilities {
class Random {
 private:
  std::vector<uint8_t> internal_buffer_;

 public:
  /**
   * Construct a Random object from the given randomness.
   * @param randomness Random data.
   * @param len the length of randomness.
   */
  explicit Random(const uint8_t *randomness, size_t len);

  /**
   * Compare the contents of the internal buffers for equality and in constant
   * time.
   * @param rhs The instance to compare for equality.
   * @return True or false.
   */
  bool operator==(const Random &rhs) const;
  bool operator!=(const Random &rhs) const;

  /**
   * The size of the internal random buffer in bytes.
   * @return The number of bytes of randomness.
   */
  size_t Size() const;

  /**
   * Encode to an unpadded, URL safe base64 string suitable for use in HTTP
   * query parameters and as a store key.
   * @return the encoded string.
   */
  std::string Str() const;

  /**
   * Decode from the given string representation.
   * @param str The string to decode
   * @return The decoded Random.
   */
  static absl::optional<Random> FromString(absl::string_view str);

  /**
   * The length of the string produced by Str() for a buffer of the given
   * number of bytes.
   */
  static size_t EncodedLength(size_t bytes);
};

class RandomGenerator {
 public:
  virtual ~RandomGenerator() = default;

  /**
   * Generate a Random with the requested number of bytes of data read from the
   * generator's random source. Aborts the process if the source fails.
   * @param sz The number of bytes to read from the generator's random source.
   * @return A Random object.
   */
  virtual Random Generate(size_t sz);

  /**
   * Generate a URL safe random string. The string encodes the fewest random
   * bytes whose encoding is at least min_length characters long.
   * @param min_length the minimum length of the returned string.
   * @return the encoded random string.
   */
  std::string GenerateString(size_t min_length);
};

}  // namespace utilities
}  // namespace common
}  // namespace authbridge
#endif  // AUTHBRIDGE_SRC_COMMON_UTILITIES_RANDOM_H_
