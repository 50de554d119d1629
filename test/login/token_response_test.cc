#include "src/login/token_response.h"

#include "absl/strings/str_cat.h"
#include "gtest/gtest.h"
#include "test/login/fixtures.h"

namespace authbridge {
namespace login {
namespace {

std::string TokenResponseWith(absl::string_view fields) {
  return absl::StrCat(R"({"id_token":")", fixtures::kIdToken, R"(",)", fields,
                      "}");
}

}  // namespace

class TokenResponseParserTest : public ::testing::Test {
 protected:
  std::shared_ptr<TokenResponseParserImpl> parser_;

  void SetUp() override {
    parser_ = std::make_shared<TokenResponseParserImpl>(
        std::make_shared<StaticJwksResolverImpl>(fixtures::kValidJwks));
  }
};

TEST_F(TokenResponseParserTest, Parse) {
  auto result = parser_->Parse(
      fixtures::kClientId,
      TokenResponseWith(
          R"("token_type":"Bearer","access_token":"access_token_value","expires_in":3600)"));
  ASSERT_TRUE(result);
  ASSERT_EQ(result->Nonce(), fixtures::kIdTokenNonce);
  ASSERT_EQ(result->AccessToken(), "access_token_value");
  ASSERT_EQ(result->IDToken().sub_, "test@example.com");
}

TEST_F(TokenResponseParserTest, ParseWithoutAccessToken) {
  auto result = parser_->Parse(fixtures::kClientId,
                               TokenResponseWith(R"("token_type":"bearer")"));
  ASSERT_TRUE(result);
  ASSERT_FALSE(result->AccessToken().has_value());
}

TEST_F(TokenResponseParserTest, ParseInvalidJSON) {
  auto result = parser_->Parse(fixtures::kClientId, "invalid json");
  ASSERT_FALSE(result);
}

TEST_F(TokenResponseParserTest, ParseMissingTokenType) {
  auto result = parser_->Parse(fixtures::kClientId, R"({})");
  ASSERT_FALSE(result);
}

TEST_F(TokenResponseParserTest, ParseInvalidTokenType) {
  auto result = parser_->Parse(fixtures::kClientId,
                               TokenResponseWith(R"("token_type":"BabyBearer")"));
  ASSERT_FALSE(result);
}

TEST_F(TokenResponseParserTest, ParseMissingIdentityToken) {
  auto result = parser_->Parse(fixtures::kClientId, R"({"token_type":"Bearer"})");
  ASSERT_FALSE(result);
}

TEST_F(TokenResponseParserTest, ParseInvalidIdentityTokenType) {
  auto result = parser_->Parse(fixtures::kClientId,
                               R"({"token_type":"Bearer","id_token":1})");
  ASSERT_FALSE(result);
}

TEST_F(TokenResponseParserTest, ParseInvalidJwtEncoding) {
  auto result = parser_->Parse(fixtures::kClientId,
                               R"({"token_type":"Bearer","id_token":"wrong"})");
  ASSERT_FALSE(result);
}

TEST_F(TokenResponseParserTest, ParseWithoutKeySet) {
  TokenResponseParserImpl parser(
      std::make_shared<StaticJwksResolverImpl>(fixtures::kInvalidJwks));
  auto result = parser.Parse(fixtures::kClientId,
                             TokenResponseWith(R"("token_type":"Bearer")"));
  ASSERT_FALSE(result);
}

TEST_F(TokenResponseParserTest, ParseMissingAudience) {
  auto result =
      parser_->Parse("missing", TokenResponseWith(R"("token_type":"Bearer")"));
  ASSERT_FALSE(result);
}

TEST_F(TokenResponseParserTest, InvalidExpiresInFieldValue) {
  auto result = parser_->Parse(
      fixtures::kClientId,
      TokenResponseWith(R"("token_type":"bearer","expires_in":-1)"));
  ASSERT_FALSE(result);
}

}  // namespace login
}  // namespace authbridge
