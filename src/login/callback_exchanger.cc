#include "src/login/callback_exchanger.h"

#include "absl/strings/str_format.h"
#include "spdlog/spdlog.h"
#include "src/login/errors.h"

namespace authbridge {
namespace login {
namespace {

enum class Outcome { kSucceeded, kFailed };

CallbackResponse Succeeded() {
  return CallbackResponse{boost::beast::http::status::ok,
                          "Login successful. You may close this window."};
}

CallbackResponse AuthorizationFailed(absl::string_view state) {
  return CallbackResponse{
      boost::beast::http::status::unauthorized,
      absl::StrFormat("authorization failed (state token: %s; logs may "
                      "contain more information)",
                      state)};
}

CallbackResponse TemporaryError(absl::string_view state) {
  return CallbackResponse{
      boost::beast::http::status::internal_server_error,
      absl::StrFormat("temporary error, please retry the login (state token: "
                      "%s; logs may contain more information)",
                      state)};
}

}  // namespace

CallbackExchanger::CallbackExchanger(OidcClientPtr oidc_client,
                                     SessionStorePtr session_store)
    : oidc_client_(oidc_client), session_store_(session_store) {}

CallbackResponse CallbackExchanger::HandleCallback(
    absl::string_view code, absl::string_view state,
    boost::asio::io_context &ioc, boost::asio::yield_context yield) {
  if (oidc_client_ == nullptr) {
    spdlog::warn("{}: callback received without an identity provider",
                 __func__);
    return CallbackResponse{boost::beast::http::status::conflict,
                            "no identity provider configured"};
  }
  if (code.empty() || state.empty()) {
    spdlog::info("{}: callback is missing the code or the state", __func__);
    return CallbackResponse{boost::beast::http::status::bad_request,
                            "missing code or state"};
  }

  spdlog::info("{}: exchanging authorization code (state token: {})",
               __func__, std::string(state));
  auto exchange = oidc_client_->ExchangeCode(code, ioc, yield);
  if (exchange.ok()) {
    spdlog::info("{}: exchanged authorization code (state token: {}, nonce: {})",
                 __func__, std::string(state), exchange->nonce);
  } else {
    spdlog::error("{}: code exchange failed (state token: {}): {}", __func__,
                  std::string(state), exchange.status().ToString());
  }

  Outcome outcome = Outcome::kFailed;
  auto status = session_store_->TransactionalUpdate(
      state, [&exchange, &outcome, state](SessionInfo *record) {
        // A duplicate redirect finds the record already terminal and
        // reproduces the committed outcome.
        if (!record->access_token().empty()) {
          outcome = Outcome::kSucceeded;
          return absl::OkStatus();
        }
        if (record->conversion_failed()) {
          outcome = Outcome::kFailed;
          return absl::OkStatus();
        }

        if (!exchange.ok()) {
          record->set_conversion_failed(true);
          outcome = Outcome::kFailed;
          return absl::OkStatus();
        }
        if (exchange->nonce != record->nonce()) {
          spdlog::error(
              "{}: nonce mismatch (state token: {}, expected nonce: {}, "
              "received nonce: {})",
              "HandleCallback", std::string(state), record->nonce(), exchange->nonce);
          record->set_conversion_failed(true);
          outcome = Outcome::kFailed;
          return absl::OkStatus();
        }
        record->set_access_token(exchange->access_token);
        outcome = Outcome::kSucceeded;
        return absl::OkStatus();
      });

  if (!status.ok()) {
    spdlog::error("{}: failed to record the login outcome (state token: {}): {}",
                  __func__, std::string(state), status.ToString());
    // A rejected code fails the login no matter what became of the record.
    if (!exchange.ok()) {
      return AuthorizationFailed(state);
    }
    return TemporaryError(state);
  }
  if (outcome == Outcome::kFailed) {
    spdlog::info("{}: login failed (state token: {})", __func__,
                 std::string(state));
    return AuthorizationFailed(state);
  }
  spdlog::info("{}: login succeeded (state token: {})", __func__,
                 std::string(state));
  return Succeeded();
}

}  // namespace login
}  // namespace authbridge
