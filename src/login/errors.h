#ifndef AUTHBRIDGE_SRC_LOGIN_ERRORS_H_
#define AUTHBRIDGE_SRC_LOGIN_ERRORS_H_

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace authbridge {
namespace login {

// No identity provider is configured. Not retryable.
absl::Status NotConfiguredError(absl::string_view message);
bool IsNotConfigured(const absl::Status &status);

// The coordination store could not complete an operation. Retryable by the
// caller of the failed operation.
absl::Status StoreUnavailableError(absl::string_view message);
bool IsStoreUnavailable(const absl::Status &status);

// A session watch broke. Re-established by SessionWaiter.
absl::Status WatchTransportError(absl::string_view message);
bool IsWatchTransportError(const absl::Status &status);

// The session disappeared before the login completed.
absl::Status SessionExpiredError(absl::string_view message);
bool IsSessionExpired(const absl::Status &status);

// The code exchange, the ID token verification or the nonce check failed.
absl::Status AuthorizationFailedError(absl::string_view message);
bool IsAuthorizationFailed(const absl::Status &status);

// The identity of a successfully logged in user could not be fetched.
absl::Status IdentityFetchError(absl::string_view message);
bool IsIdentityFetchError(const absl::Status &status);

}  // namespace login
}  // namespace authbridge

#endif  // AUTHBRIDGE_SRC_LOGIN_ERRORS_H_
