#ifndef AUTHBRIDGE_SRC_LOGIN_JWT_VERIFIER_H_
#define AUTHBRIDGE_SRC_LOGIN_JWT_VERIFIER_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "jwt_verify_lib/jwt.h"
#include "src/login/jwks_resolver.h"

namespace authbridge {
namespace login {

class JwtVerifier {
 public:
  explicit JwtVerifier(JwksResolverPtr resolver) : resolver_(resolver) {}

  /**
   * Verify the signature, the expiry and the audience of a JWT.
   * @param jwt the parsed token.
   * @param aud the audiences of which at least one must be present.
   */
  absl::Status verify(const google::jwt_verify::Jwt& jwt,
                      std::vector<std::string>&& aud) const;

 private:
  JwksResolverPtr resolver_;
};

}  // namespace login
}  // namespace authbridge

#endif  // AUTHBRIDGE_SRC_LOGIN_JWT_VERIFIER_H_
