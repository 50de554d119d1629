#ifndef AUTHBRIDGE_SRC_LOGIN_USER_INFO_H_
#define AUTHBRIDGE_SRC_LOGIN_USER_INFO_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace authbridge {
namespace login {

/**
 * The claims of a UserInfo response, see
 * https://openid.net/specs/openid-connect-core-1_0.html#UserInfoResponse.
 */
struct UserInfo {
  std::string subject;
  std::string email;
  bool email_verified = false;
  std::string name;
};

/**
 * Parse a UserInfo response body. The `sub` and `email` claims are required.
 */
absl::StatusOr<UserInfo> ParseUserInfo(absl::string_view raw);

}  // namespace login
}  // namespace authbridge

#endif  // AUTHBRIDGE_SRC_LOGIN_USER_INFO_H_
