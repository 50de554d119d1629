#include "src/login/jwt_verifier.h"

#include "jwt_verify_lib/verify.h"

namespace authbridge {
namespace login {

absl::Status JwtVerifier::verify(const google::jwt_verify::Jwt& jwt,
                                 std::vector<std::string>&& aud) const {
  auto jwks = resolver_->jwks();
  if (jwks == nullptr) {
    return absl::FailedPreconditionError("no JWKs loaded");
  }
  auto status = google::jwt_verify::verifyJwt(jwt, *jwks, aud);
  if (status != google::jwt_verify::Status::Ok) {
    return absl::InvalidArgumentError(
        fmt::format("failed to verify signature or find expected audiences: {}",
                    google::jwt_verify::getStatusString(status)));
  }
  return absl::OkStatus();
}

}  // namespace login
}  // namespace authbridge
