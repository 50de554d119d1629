#ifndef AUTHBRIDGE_SESSION_STRING_GENERATOR_H
#define AUTHBRIDGE_SESSION_STRING_GENERATOR_H

#include <memory>
#include <string>

namespace authbridge {
namespace common {
namespace session {

class SessionStringGenerator;

typedef std::shared_ptr<SessionStringGenerator> SessionStringGeneratorPtr;

class SessionStringGenerator {
public:
  virtual ~SessionStringGenerator() = default;

  // The state token correlating one login attempt across the initiator, the
  // callback and the waiter.
  virtual std::string GenerateState();

  virtual std::string GenerateNonce();

private:
  virtual std::string GenerateRandomString(size_t min_length);
};

} // namespace session
} // namespace common
} // namespace authbridge

#endif //AUTHBRIDGE_SESSION_STRING_GENERATOR_H
