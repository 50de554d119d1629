#ifndef AUTHBRIDGE_SRC_LOGIN_OIDC_CLIENT_H_
#define AUTHBRIDGE_SRC_LOGIN_OIDC_CLIENT_H_

#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include <memory>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "src/login/user_info.h"

namespace authbridge {
namespace login {

// What a successful code exchange yields.
struct CodeExchange {
  // The nonce claim of the verified ID token.
  std::string nonce;
  std::string access_token;
};

/**
 * The identity provider as seen by the login flow.
 */
class OidcClient {
 public:
  virtual ~OidcClient() = default;

  /**
   * @return the provider URL that starts an authorization code flow carrying
   * the given state and nonce.
   */
  virtual std::string AuthorizationUrl(absl::string_view state,
                                       absl::string_view nonce) const = 0;

  /**
   * Exchange an authorization code for tokens and verify the ID token.
   * To be used inside a Boost co-routine.
   */
  virtual absl::StatusOr<CodeExchange> ExchangeCode(
      absl::string_view code, boost::asio::io_context &ioc,
      boost::asio::yield_context yield) = 0;

  /**
   * Fetch the claims of the user the access token was issued to.
   * To be used inside a Boost co-routine.
   */
  virtual absl::StatusOr<UserInfo> FetchUserInfo(
      absl::string_view access_token, boost::asio::io_context &ioc,
      boost::asio::yield_context yield) = 0;

  /**
   * @return whether a key set to verify ID tokens with is loaded.
   */
  virtual bool JwksActive() = 0;
};

typedef std::shared_ptr<OidcClient> OidcClientPtr;

}  // namespace login
}  // namespace authbridge

#endif  // AUTHBRIDGE_SRC_LOGIN_OIDC_CLIENT_H_
