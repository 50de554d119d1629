#include "src/login/user_info.h"

#include "absl/strings/str_cat.h"
#include "google/protobuf/struct.pb.h"
#include "google/protobuf/util/json_util.h"
#include "src/login/errors.h"

namespace authbridge {
namespace login {
namespace {
const char *subject_field = "sub";
const char *email_field = "email";
const char *email_verified_field = "email_verified";
const char *name_field = "name";

absl::optional<std::string> StringClaim(
    const google::protobuf::Map<std::string, google::protobuf::Value> &fields,
    const char *claim) {
  auto iter = fields.find(claim);
  if (iter == fields.end() ||
      iter->second.kind_case() != google::protobuf::Value::kStringValue) {
    return absl::nullopt;
  }
  return iter->second.string_value();
}
}  // namespace

absl::StatusOr<UserInfo> ParseUserInfo(absl::string_view raw) {
  ::google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  ::google::protobuf::Struct message;
  const auto status = ::google::protobuf::util::JsonStringToMessage(
      std::string(raw), &message, options);
  if (!status.ok()) {
    return IdentityFetchError(
        absl::StrCat("malformed userinfo response: ", std::string(status.message())));
  }

  const auto &fields = message.fields();
  UserInfo user_info;
  auto subject = StringClaim(fields, subject_field);
  if (!subject.has_value() || subject->empty()) {
    return IdentityFetchError("userinfo response has no `sub` claim");
  }
  user_info.subject = *subject;

  auto email = StringClaim(fields, email_field);
  if (!email.has_value() || email->empty()) {
    return IdentityFetchError("userinfo response has no `email` claim");
  }
  user_info.email = *email;

  auto email_verified = fields.find(email_verified_field);
  if (email_verified != fields.end()) {
    // Some providers send the claim as a string.
    const auto &value = email_verified->second;
    user_info.email_verified =
        value.kind_case() == google::protobuf::Value::kBoolValue
            ? value.bool_value()
            : value.string_value() == "true";
  }

  auto name = StringClaim(fields, name_field);
  if (name.has_value()) {
    user_info.name = *name;
  }
  return user_info;
}

}  // namespace login
}  // namespace authbridge
