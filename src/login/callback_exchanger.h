#ifndef AUTHBRIDGE_SRC_LOGIN_CALLBACK_EXCHANGER_H_
#define AUTHBRIDGE_SRC_LOGIN_CALLBACK_EXCHANGER_H_

#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/http/status.hpp>
#include <string>

#include "absl/strings/string_view.h"
#include "src/login/oidc_client.h"
#include "src/login/session_store.h"

namespace authbridge {
namespace login {

struct CallbackResponse {
  boost::beast::http::status status;
  // A human readable message without any detail of the failure.
  std::string body;
};

/**
 * Handles the identity provider's redirect: exchanges the authorization code
 * and records the outcome in the login session, verifying the nonce in the
 * same transaction.
 */
class CallbackExchanger {
 private:
  OidcClientPtr oidc_client_;
  SessionStorePtr session_store_;

 public:
  /**
   * @param oidc_client the identity provider, null when none is configured.
   */
  CallbackExchanger(OidcClientPtr oidc_client, SessionStorePtr session_store);

  /**
   * To be used inside a Boost co-routine.
   * @param code the authorization code, empty when missing.
   * @param state the state token, empty when missing.
   * @return exactly one of 200, 400, 401, 409 or 500.
   */
  CallbackResponse HandleCallback(absl::string_view code,
                                  absl::string_view state,
                                  boost::asio::io_context &ioc,
                                  boost::asio::yield_context yield);
};

}  // namespace login
}  // namespace authbridge

#endif  // AUTHBRIDGE_SRC_LOGIN_CALLBACK_EXCHANGER_H_
