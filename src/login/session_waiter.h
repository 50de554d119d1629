#ifndef AUTHBRIDGE_SRC_LOGIN_SESSION_WAITER_H_
#define AUTHBRIDGE_SRC_LOGIN_SESSION_WAITER_H_

#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include <chrono>
#include <functional>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "src/common/utilities/backoff.h"
#include "src/login/oidc_client.h"
#include "src/login/session_store.h"

namespace authbridge {
namespace login {

/**
 * Resolves a state token into the identity of the user who logged in with it,
 * waiting for the callback to record the outcome of the login.
 */
class SessionWaiter {
 private:
  OidcClientPtr oidc_client_;
  SessionStorePtr session_store_;
  common::utilities::BackOffPolicy policy_;
  std::chrono::milliseconds poll_interval_;

 public:
  using CancelledPredicate = std::function<bool()>;

  /**
   * @param oidc_client the identity provider, null when none is configured.
   * @param policy bounds the re-establishment of broken watches.
   * @param poll_interval how long a single watch read blocks before
   * cancellation is checked again.
   */
  SessionWaiter(OidcClientPtr oidc_client, SessionStorePtr session_store,
                const common::utilities::BackOffPolicy &policy,
                std::chrono::milliseconds poll_interval);

  /**
   * Block until the login attempt of the given state token is terminal. To
   * be used inside a Boost co-routine.
   * @param cancelled polled while waiting; resolution stops with CANCELLED
   * once it returns true. May be empty.
   * @return the user's identity, or one of DEADLINE_EXCEEDED (the session
   * expired), UNAUTHENTICATED (the login failed), INTERNAL (the identity
   * could not be fetched), UNAVAILABLE (the watch kept failing),
   * FAILED_PRECONDITION (no identity provider) or CANCELLED.
   */
  absl::StatusOr<UserInfo> Resolve(absl::string_view state,
                                   boost::asio::io_context &ioc,
                                   boost::asio::yield_context yield,
                                   const CancelledPredicate &cancelled);
};

}  // namespace login
}  // namespace authbridge

#endif  // AUTHBRIDGE_SRC_LOGIN_SESSION_WAITER_H_
