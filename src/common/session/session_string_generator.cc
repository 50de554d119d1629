#include "session_string_generator.h"
#include "src/common/utilities/random.h"

namespace authbridge {
namespace common {
namespace session {

namespace {
const size_t token_length_ = 30;
}

std::string SessionStringGenerator::GenerateState() {
  return GenerateRandomString(token_length_);
}

std::string SessionStringGenerator::GenerateNonce() {
  return GenerateRandomString(token_length_);
}

std::string SessionStringGenerator::GenerateRandomString(size_t min_length) {
  utilities::RandomGenerator generator;
  return generator.GenerateString(min_length);
}

}  // namespace session
}  // namespace common
}  // namespace authbridge
