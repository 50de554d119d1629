#include "src/login/errors.h"

namespace authbridge {
namespace login {

absl::Status NotConfiguredError(absl::string_view message) {
  return absl::FailedPreconditionError(message);
}

bool IsNotConfigured(const absl::Status &status) {
  return absl::IsFailedPrecondition(status);
}

absl::Status StoreUnavailableError(absl::string_view message) {
  return absl::UnavailableError(message);
}

bool IsStoreUnavailable(const absl::Status &status) {
  return absl::IsUnavailable(status);
}

absl::Status WatchTransportError(absl::string_view message) {
  return absl::AbortedError(message);
}

bool IsWatchTransportError(const absl::Status &status) {
  return absl::IsAborted(status);
}

absl::Status SessionExpiredError(absl::string_view message) {
  return absl::DeadlineExceededError(message);
}

bool IsSessionExpired(const absl::Status &status) {
  return absl::IsDeadlineExceeded(status);
}

absl::Status AuthorizationFailedError(absl::string_view message) {
  return absl::UnauthenticatedError(message);
}

bool IsAuthorizationFailed(const absl::Status &status) {
  return absl::IsUnauthenticated(status);
}

absl::Status IdentityFetchError(absl::string_view message) {
  return absl::InternalError(message);
}

bool IsIdentityFetchError(const absl::Status &status) {
  return absl::IsInternal(status);
}

}  // namespace login
}  // namespace authbridge
