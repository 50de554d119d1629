#include <atomic>
#include <boost/asio/spawn.hpp>
#include <thread>

#include "absl/strings/str_cat.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "src/login/callback_exchanger.h"
#include "src/login/errors.h"
#include "src/login/login_session_initiator.h"
#include "src/login/session_waiter.h"
#include "src/store/in_memory_coordination_store.h"
#include "test/common/utilities/mocks.h"
#include "test/login/mocks.h"

namespace authbridge {
namespace login {

using ::testing::_;
using ::testing::Eq;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

namespace beast = boost::beast;

// Drives a whole login through the initiator, the callback and the waiter
// sharing one store, the way the gRPC service and the callback server do.
class LoginFlowTest : public ::testing::Test {
 protected:
  std::shared_ptr<NiceMock<OidcClientMock>> oidc_client_;
  SessionStorePtr session_store_;
  std::unique_ptr<LoginSessionInitiator> initiator_;
  std::unique_ptr<CallbackExchanger> exchanger_;
  std::unique_ptr<SessionWaiter> waiter_;
  std::map<std::string, std::string> nonces_;
  std::atomic<int64_t> now_ms_{1000000};

  void SetUp() override {
    auto time_service =
        std::make_shared<NiceMock<common::utilities::TimeServiceMock>>();
    ON_CALL(*time_service, GetCurrentTimeInMillisecondsSinceEpoch())
        .WillByDefault(Invoke([this]() { return now_ms_.load(); }));

    oidc_client_ = std::make_shared<NiceMock<OidcClientMock>>();
    ON_CALL(*oidc_client_, AuthorizationUrl(_, _))
        .WillByDefault(Invoke([this](absl::string_view state,
                                     absl::string_view nonce) {
          nonces_[std::string(state)] = std::string(nonce);
          return absl::StrCat("https://idp.example.com/authorize?state=",
                              state);
        }));

    session_store_ = std::make_shared<SessionStore>(
        std::make_shared<store::InMemoryCoordinationStore>(time_service));
    initiator_ = std::make_unique<LoginSessionInitiator>(
        oidc_client_, session_store_,
        std::make_shared<common::session::SessionStringGenerator>(),
        std::chrono::seconds(60));
    exchanger_ =
        std::make_unique<CallbackExchanger>(oidc_client_, session_store_);
    common::utilities::BackOffPolicy policy;
    policy.max_elapsed = std::chrono::milliseconds(1000);
    waiter_ = std::make_unique<SessionWaiter>(oidc_client_, session_store_,
                                              policy,
                                              std::chrono::milliseconds(20));
  }

  CallbackResponse Callback(absl::string_view code, absl::string_view state) {
    boost::asio::io_context ioc;
    CallbackResponse response;
    boost::asio::spawn(ioc, [&](boost::asio::yield_context yield) {
      response = exchanger_->HandleCallback(code, state, ioc, yield);
    });
    ioc.run();
    return response;
  }

  absl::StatusOr<UserInfo> Resolve(absl::string_view state) {
    boost::asio::io_context ioc;
    absl::StatusOr<UserInfo> result = absl::UnknownError("not run");
    boost::asio::spawn(ioc, [&](boost::asio::yield_context yield) {
      result = waiter_->Resolve(state, ioc, yield, nullptr);
    });
    ioc.run();
    return result;
  }
};

TEST_F(LoginFlowTest, SuccessfulLogin) {
  auto start = initiator_->BeginLogin();
  ASSERT_TRUE(start.ok());
  ASSERT_EQ(start->login_url,
            "https://idp.example.com/authorize?state=" + start->state);

  EXPECT_CALL(*oidc_client_, ExchangeCode(Eq("the-code"), _, _))
      .WillOnce(Return(CodeExchange{nonces_[start->state], "access"}));
  UserInfo user;
  user.subject = "1";
  user.email = "jane@example.com";
  EXPECT_CALL(*oidc_client_, FetchUserInfo(Eq("access"), _, _))
      .WillOnce(Return(user));

  absl::StatusOr<UserInfo> resolved = absl::UnknownError("not run");
  std::thread waiter([this, &start, &resolved]() {
    resolved = Resolve(start->state);
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  auto response = Callback("the-code", start->state);
  waiter.join();

  ASSERT_EQ(response.status, beast::http::status::ok);
  ASSERT_TRUE(resolved.ok());
  ASSERT_EQ(resolved->email, "jane@example.com");

  // The session is consumed.
  ASSERT_TRUE(IsSessionExpired(Resolve(start->state).status()));
}

TEST_F(LoginFlowTest, CallbackBeforeTheWaiter) {
  auto start = initiator_->BeginLogin();
  ASSERT_TRUE(start.ok());
  EXPECT_CALL(*oidc_client_, ExchangeCode(_, _, _))
      .WillOnce(Return(CodeExchange{nonces_[start->state], "access"}));
  UserInfo user;
  user.subject = "1";
  user.email = "jane@example.com";
  EXPECT_CALL(*oidc_client_, FetchUserInfo(Eq("access"), _, _))
      .WillOnce(Return(user));

  ASSERT_EQ(Callback("the-code", start->state).status,
            beast::http::status::ok);
  auto resolved = Resolve(start->state);
  ASSERT_TRUE(resolved.ok());
}

TEST_F(LoginFlowTest, ReplayedCallbackForAnotherSession) {
  auto first = initiator_->BeginLogin();
  auto second = initiator_->BeginLogin();
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());

  // An ID token issued for the first login must not complete the second.
  EXPECT_CALL(*oidc_client_, ExchangeCode(_, _, _))
      .WillOnce(Return(CodeExchange{nonces_[first->state], "access"}));
  ASSERT_EQ(Callback("the-code", second->state).status,
            beast::http::status::unauthorized);
  ASSERT_TRUE(IsAuthorizationFailed(Resolve(second->state).status()));
}

TEST_F(LoginFlowTest, ExpiredLogin) {
  auto start = initiator_->BeginLogin();
  ASSERT_TRUE(start.ok());
  now_ms_ += 61000;

  ASSERT_TRUE(IsSessionExpired(Resolve(start->state).status()));

  EXPECT_CALL(*oidc_client_, ExchangeCode(_, _, _))
      .WillOnce(Return(CodeExchange{nonces_[start->state], "access"}));
  ASSERT_EQ(Callback("the-code", start->state).status,
            beast::http::status::internal_server_error);
}

TEST_F(LoginFlowTest, CallbackWithoutCodeLeavesTheLoginPending) {
  auto start = initiator_->BeginLogin();
  ASSERT_TRUE(start.ok());
  EXPECT_CALL(*oidc_client_, ExchangeCode(_, _, _)).Times(0);
  ASSERT_EQ(Callback("", start->state).status,
            beast::http::status::bad_request);

  // The waiter still only sees a pending session until it expires.
  int polls = 0;
  boost::asio::io_context ioc;
  absl::StatusOr<UserInfo> result = absl::UnknownError("not run");
  boost::asio::spawn(ioc, [&](boost::asio::yield_context yield) {
    result = waiter_->Resolve(start->state, ioc, yield, [&]() {
      if (++polls == 3) {
        now_ms_ += 61000;
      }
      return false;
    });
  });
  ioc.run();
  ASSERT_TRUE(IsSessionExpired(result.status()));
}

}  // namespace login
}  // namespace authbridge
