#ifndef AUTHBRIDGE_SRC_LOGIN_LOGIN_SESSION_INITIATOR_H_
#define AUTHBRIDGE_SRC_LOGIN_LOGIN_SESSION_INITIATOR_H_

#include <chrono>
#include <string>

#include "absl/status/statusor.h"
#include "src/common/session/session_string_generator.h"
#include "src/login/oidc_client.h"
#include "src/login/session_store.h"

namespace authbridge {
namespace login {

struct LoginStart {
  // The provider URL to send the user's browser to.
  std::string login_url;
  // The state token to resolve the login with.
  std::string state;
};

class LoginSessionInitiator {
 private:
  OidcClientPtr oidc_client_;
  SessionStorePtr session_store_;
  common::session::SessionStringGeneratorPtr generator_;
  std::chrono::seconds session_ttl_;

 public:
  /**
   * @param oidc_client the identity provider, null when none is configured.
   * @param session_ttl how long an unfinished login attempt is kept.
   */
  LoginSessionInitiator(OidcClientPtr oidc_client,
                        SessionStorePtr session_store,
                        common::session::SessionStringGeneratorPtr generator,
                        std::chrono::seconds session_ttl);

  /**
   * Register a pending login session and build the provider URL for it.
   * @return FAILED_PRECONDITION without an identity provider, UNAVAILABLE
   * when the session could not be stored.
   */
  absl::StatusOr<LoginStart> BeginLogin();
};

}  // namespace login
}  // namespace authbridge

#endif  // AUTHBRIDGE_SRC_LOGIN_LOGIN_SESSION_INITIATOR_H_
