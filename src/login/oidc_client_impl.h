#ifndef AUTHBRIDGE_SRC_LOGIN_OIDC_CLIENT_IMPL_H_
#define AUTHBRIDGE_SRC_LOGIN_OIDC_CLIENT_IMPL_H_

#include "config/oidc/config.pb.h"
#include "src/common/http/http.h"
#include "src/login/jwks_resolver.h"
#include "src/login/oidc_client.h"
#include "src/login/token_response.h"

namespace authbridge {
namespace login {

/**
 * An OidcClient talking to the endpoints named in the configuration.
 */
class OidcClientImpl : public OidcClient {
 private:
  const config::oidc::OIDCConfig config_;
  common::http::ptr_t http_ptr_;
  JwksResolverPtr jwks_resolver_;
  TokenResponseParserPtr parser_;

  std::string Scopes() const;

 public:
  OidcClientImpl(const config::oidc::OIDCConfig &config,
                 common::http::ptr_t http_ptr, JwksResolverPtr jwks_resolver,
                 TokenResponseParserPtr parser);

  std::string AuthorizationUrl(absl::string_view state,
                               absl::string_view nonce) const override;

  absl::StatusOr<CodeExchange> ExchangeCode(
      absl::string_view code, boost::asio::io_context &ioc,
      boost::asio::yield_context yield) override;

  absl::StatusOr<UserInfo> FetchUserInfo(
      absl::string_view access_token, boost::asio::io_context &ioc,
      boost::asio::yield_context yield) override;

  bool JwksActive() override;
};

}  // namespace login
}  // namespace authbridge

#endif  // AUTHBRIDGE_SRC_LOGIN_OIDC_CLIENT_IMPL_H_
