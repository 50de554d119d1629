#include "src/login/oidc_client_impl.h"

#include <set>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "spdlog/spdlog.h"
#include "src/common/http/headers.h"
#include "src/login/errors.h"

namespace authbridge {
namespace login {
namespace {
const char *mandatory_scope_ = "openid";
const std::vector<std::string> default_scopes_ = {"profile", "email"};
}  // namespace

OidcClientImpl::OidcClientImpl(const config::oidc::OIDCConfig &config,
                               common::http::ptr_t http_ptr,
                               JwksResolverPtr jwks_resolver,
                               TokenResponseParserPtr parser)
    : config_(config),
      http_ptr_(http_ptr),
      jwks_resolver_(jwks_resolver),
      parser_(parser) {}

std::string OidcClientImpl::Scopes() const {
  std::set<std::string> scopes = {mandatory_scope_};
  if (config_.scopes().empty()) {
    scopes.insert(default_scopes_.begin(), default_scopes_.end());
  } else {
    scopes.insert(config_.scopes().begin(), config_.scopes().end());
  }
  return absl::StrJoin(scopes, " ");
}

std::string OidcClientImpl::AuthorizationUrl(absl::string_view state,
                                             absl::string_view nonce) const {
  auto scopes = Scopes();
  std::multimap<absl::string_view, absl::string_view> params = {
      {"response_type", "code"},
      {"scope", scopes},
      {"client_id", config_.client_id()},
      {"redirect_uri", config_.callback_uri()},
      {"state", state},
      {"nonce", nonce},
  };
  return absl::StrCat(config_.authorization_uri(), "?",
                      common::http::Http::EncodeQueryData(params));
}

absl::StatusOr<CodeExchange> OidcClientImpl::ExchangeCode(
    absl::string_view code, boost::asio::io_context &ioc,
    boost::asio::yield_context yield) {
  std::map<absl::string_view, absl::string_view> headers = {
      {common::http::headers::ContentType,
       common::http::headers::ContentTypeDirectives::FormUrlEncoded},
      {common::http::headers::Accept,
       common::http::headers::ContentTypeDirectives::Json},
  };
  auto authorization = common::http::Http::EncodeBasicAuth(
      config_.client_id(), config_.client_secret());
  headers.emplace(common::http::headers::Authorization, authorization);

  std::multimap<absl::string_view, absl::string_view> params = {
      {"code", code},
      {"redirect_uri", config_.callback_uri()},
      {"grant_type", "authorization_code"},
  };

  auto retrieved_token_response = http_ptr_->Post(
      config_.token_uri(), headers,
      common::http::Http::EncodeFormData(params),
      config_.trusted_certificate_authority(), ioc, yield);
  if (retrieved_token_response == nullptr) {
    return AuthorizationFailedError("HTTP token response error");
  }
  if (retrieved_token_response->result() != boost::beast::http::status::ok) {
    return AuthorizationFailedError(
        absl::StrCat("HTTP token response status ",
                     retrieved_token_response->result_int()));
  }

  auto token_response =
      parser_->Parse(config_.client_id(), retrieved_token_response->body());
  if (token_response == nullptr) {
    return AuthorizationFailedError("invalid token response");
  }
  auto nonce = token_response->Nonce();
  if (!nonce.has_value()) {
    return AuthorizationFailedError("ID token has no nonce claim");
  }
  auto access_token = token_response->AccessToken();
  if (!access_token.has_value()) {
    return AuthorizationFailedError("token response has no access token");
  }
  return CodeExchange{*nonce, *access_token};
}

absl::StatusOr<UserInfo> OidcClientImpl::FetchUserInfo(
    absl::string_view access_token, boost::asio::io_context &ioc,
    boost::asio::yield_context yield) {
  auto authorization = common::http::Http::EncodeBearer(access_token);
  std::map<absl::string_view, absl::string_view> headers = {
      {common::http::headers::Authorization, authorization},
      {common::http::headers::Accept,
       common::http::headers::ContentTypeDirectives::Json},
  };
  auto response = http_ptr_->Get(config_.userinfo_uri(), headers,
                                 config_.trusted_certificate_authority(), ioc,
                                 yield);
  if (response == nullptr) {
    return IdentityFetchError("HTTP userinfo response error");
  }
  if (response->result() != boost::beast::http::status::ok) {
    return IdentityFetchError(absl::StrCat("HTTP userinfo response status ",
                                           response->result_int()));
  }
  return ParseUserInfo(response->body());
}

bool OidcClientImpl::JwksActive() { return jwks_resolver_->jwks() != nullptr; }

}  // namespace login
}  // namespace authbridge
