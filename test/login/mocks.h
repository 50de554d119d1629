#ifndef AUTHBRIDGE_TEST_LOGIN_MOCKS_H_
#define AUTHBRIDGE_TEST_LOGIN_MOCKS_H_

#include "gmock/gmock.h"
#include "src/login/jwks_resolver.h"
#include "src/login/oidc_client.h"
#include "src/login/session_store.h"
#include "src/login/token_response.h"

namespace authbridge {
namespace login {

class OidcClientMock : public OidcClient {
 public:
  MOCK_METHOD(std::string, AuthorizationUrl,
              (absl::string_view, absl::string_view), (const, override));

  MOCK_METHOD(absl::StatusOr<CodeExchange>, ExchangeCode,
              (absl::string_view, boost::asio::io_context &,
               boost::asio::yield_context),
              (override));

  MOCK_METHOD(absl::StatusOr<UserInfo>, FetchUserInfo,
              (absl::string_view, boost::asio::io_context &,
               boost::asio::yield_context),
              (override));

  MOCK_METHOD(bool, JwksActive, (), (override));
};

class TokenResponseParserMock : public TokenResponseParser {
 public:
  MOCK_METHOD(std::shared_ptr<TokenResponse>, Parse,
              (const std::string &, const std::string &), (const, override));
};

class JwksResolverMock : public JwksResolver {
 public:
  MOCK_METHOD(SharedJwks, jwks, (), (override));
};

class SessionStoreMock : public SessionStore {
 public:
  SessionStoreMock() : SessionStore(nullptr) {}

  MOCK_METHOD(absl::Status, CreatePending,
              (absl::string_view, absl::string_view, std::chrono::seconds),
              (override));

  MOCK_METHOD(std::unique_ptr<store::Watcher>, Watch, (absl::string_view),
              (override));

  MOCK_METHOD(absl::Status, TransactionalUpdate,
              (absl::string_view, const SessionMutator &), (override));

  MOCK_METHOD(absl::Status, Delete, (absl::string_view), (override));

  MOCK_METHOD(void, RemoveAllExpired, (), (override));
};

}  // namespace login
}  // namespace authbridge

#endif  // AUTHBRIDGE_TEST_LOGIN_MOCKS_H_
