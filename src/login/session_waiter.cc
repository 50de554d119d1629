#include "src/login/session_waiter.h"

#include <algorithm>

#include <boost/asio/steady_timer.hpp>

#include "absl/strings/str_cat.h"
#include "spdlog/spdlog.h"
#include "src/login/errors.h"

namespace authbridge {
namespace login {

using common::utilities::AttemptResult;

SessionWaiter::SessionWaiter(OidcClientPtr oidc_client,
                             SessionStorePtr session_store,
                             const common::utilities::BackOffPolicy &policy,
                             std::chrono::milliseconds poll_interval)
    : oidc_client_(oidc_client),
      session_store_(session_store),
      policy_(policy),
      poll_interval_(poll_interval) {}

absl::StatusOr<UserInfo> SessionWaiter::Resolve(
    absl::string_view state, boost::asio::io_context &ioc,
    boost::asio::yield_context yield, const CancelledPredicate &cancelled) {
  if (oidc_client_ == nullptr) {
    return NotConfiguredError("no identity provider configured");
  }

  std::string access_token;
  auto watch_once = [&]() -> AttemptResult {
    if (cancelled && cancelled()) {
      return AttemptResult::Stop(
          absl::CancelledError("login resolution cancelled"));
    }
    std::unique_ptr<store::Watcher> watcher;
    try {
      watcher = session_store_->Watch(state);
    } catch (const store::StoreError &err) {
      return AttemptResult::Retry(WatchTransportError(err.what()));
    }
    while (true) {
      if (cancelled && cancelled()) {
        return AttemptResult::Stop(
            absl::CancelledError("login resolution cancelled"));
      }
      absl::optional<store::WatchEvent> event;
      try {
        event = watcher->Next(poll_interval_);
      } catch (const store::StoreError &err) {
        return AttemptResult::Retry(WatchTransportError(err.what()));
      }
      if (!event.has_value()) {
        continue;
      }

      switch (event->type) {
        case store::WatchEvent::Type::kError:
          return AttemptResult::Retry(WatchTransportError(event->error));
        case store::WatchEvent::Type::kDelete:
          return AttemptResult::Stop(SessionExpiredError(
              absl::StrCat("login session expired (state token: ", state,
                           ")")));
        case store::WatchEvent::Type::kPut: {
          auto record = SessionStore::Decode(event->value);
          if (!record.ok()) {
            // A valid record may still be written later.
            return AttemptResult::Retry(
                WatchTransportError(record.status().message()));
          }
          if (!record->access_token().empty()) {
            access_token = record->access_token();
            return AttemptResult::Done();
          }
          if (record->conversion_failed()) {
            return AttemptResult::Stop(AuthorizationFailedError(
                absl::StrCat("authorization failed (state token: ", state,
                             ")")));
          }
          // Still pending.
          break;
        }
      }
    }
  };

  common::utilities::ExponentialBackOff backoff(policy_);
  auto status = common::utilities::RetryWithBackOff(
      watch_once, backoff,
      [state](const absl::Status &error, std::chrono::milliseconds delay) {
        spdlog::error(
            "{}: session watch failed (state token: {}), re-establishing in "
            "{}ms: {}",
            "Resolve", std::string(state), delay.count(), error.ToString());
      },
      [this, &ioc, &yield, &cancelled](std::chrono::milliseconds delay) {
        auto slice = std::max(poll_interval_, std::chrono::milliseconds(1));
        while (delay.count() > 0) {
          if (cancelled && cancelled()) {
            return;
          }
          boost::asio::steady_timer timer(ioc, std::min(delay, slice));
          boost::system::error_code ec;
          timer.async_wait(yield[ec]);
          delay -= std::min(delay, slice);
        }
      });

  if (!status.ok()) {
    if (IsWatchTransportError(status)) {
      status = StoreUnavailableError(
          absl::StrCat("session watch kept failing (state token: ", state,
                       ")"));
    }
    spdlog::info("{}: login not resolved (state token: {}): {}", __func__,
                 std::string(state), status.ToString());
    return status;
  }

  auto user_info = oidc_client_->FetchUserInfo(access_token, ioc, yield);
  if (!user_info.ok()) {
    spdlog::info("{}: login not resolved (state token: {}): {}", __func__,
                 std::string(state), user_info.status().ToString());
    return user_info.status();
  }

  // The record holds a credential that is of no further use.
  auto delete_status = session_store_->Delete(state);
  if (!delete_status.ok()) {
    spdlog::warn("{}: failed to delete session (state token: {}): {}",
                 __func__, std::string(state), delete_status.ToString());
  }

  spdlog::info("{}: login resolved (state token: {}, email: {})", __func__,
               std::string(state), user_info->email);
  return user_info;
}

}  // namespace login
}  // namespace authbridge
