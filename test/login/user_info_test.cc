#include "src/login/user_info.h"

#include "gtest/gtest.h"
#include "src/login/errors.h"

namespace authbridge {
namespace login {

TEST(UserInfoTest, Parse) {
  auto user_info = ParseUserInfo(
      R"({"sub":"248289761001","email":"jane@example.com","email_verified":true,"name":"Jane Doe","picture":"http://example.com/janedoe/me.jpg"})");
  ASSERT_TRUE(user_info.ok());
  ASSERT_EQ(user_info->subject, "248289761001");
  ASSERT_EQ(user_info->email, "jane@example.com");
  ASSERT_TRUE(user_info->email_verified);
  ASSERT_EQ(user_info->name, "Jane Doe");
}

TEST(UserInfoTest, OptionalClaims) {
  auto user_info = ParseUserInfo(R"({"sub":"1","email":"jane@example.com"})");
  ASSERT_TRUE(user_info.ok());
  ASSERT_FALSE(user_info->email_verified);
  ASSERT_TRUE(user_info->name.empty());
}

TEST(UserInfoTest, EmailVerifiedAsString) {
  auto user_info = ParseUserInfo(
      R"({"sub":"1","email":"jane@example.com","email_verified":"true"})");
  ASSERT_TRUE(user_info.ok());
  ASSERT_TRUE(user_info->email_verified);
}

TEST(UserInfoTest, MissingSubject) {
  auto user_info = ParseUserInfo(R"({"email":"jane@example.com"})");
  ASSERT_TRUE(IsIdentityFetchError(user_info.status()));
}

TEST(UserInfoTest, MissingEmail) {
  auto user_info = ParseUserInfo(R"({"sub":"1"})");
  ASSERT_TRUE(IsIdentityFetchError(user_info.status()));
  user_info = ParseUserInfo(R"({"sub":"1","email":""})");
  ASSERT_TRUE(IsIdentityFetchError(user_info.status()));
}

TEST(UserInfoTest, MalformedResponse) {
  auto user_info = ParseUserInfo("<html></html>");
  ASSERT_TRUE(IsIdentityFetchError(user_info.status()));
}

}  // namespace login
}  // namespace authbridge
