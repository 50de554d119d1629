#ifndef AUTHBRIDGE_SRC_LOGIN_TOKEN_RESPONSE_H_
#define AUTHBRIDGE_SRC_LOGIN_TOKEN_RESPONSE_H_

#include <memory>
#include <string>

#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include "google/protobuf/struct.pb.h"
#include "jwt_verify_lib/jwt.h"
#include "src/login/jwt_verifier.h"

namespace authbridge {
namespace login {

/**
 * TokenResponse represents a response from a token retrieval request as
 * defined in
 * https://openid.net/specs/openid-connect-core-1_0.html#TokenResponse.
 */
class TokenResponse {
 private:
  google::jwt_verify::Jwt id_token_;
  std::string access_token_;

 public:
  explicit TokenResponse(const google::jwt_verify::Jwt &id_token);
  void SetAccessToken(absl::string_view access_token);
  const google::jwt_verify::Jwt &IDToken() const;
  absl::optional<std::string> AccessToken() const;

  /**
   * @return the nonce claim of the ID token, if any.
   */
  absl::optional<std::string> Nonce() const;
};

class TokenResponseParser;
typedef std::shared_ptr<TokenResponseParser> TokenResponseParserPtr;

/**
 * TokenResponseParser provides methods for parsing a raw input stream into a
 * @refitem TokenResponse.
 */
class TokenResponseParser {
 public:
  virtual ~TokenResponseParser() = default;

  /**
   * Parse the given token response.
   * @param client_id the expected client_id that should be present in the
   * id_token `aud` field.
   * @param raw the raw response to be parsed
   * @return either an empty result indicating an error or a TokenResponse.
   */
  virtual std::shared_ptr<TokenResponse> Parse(const std::string &client_id,
                                               const std::string &raw) const = 0;
};

class TokenResponseParserImpl final : public TokenResponseParser {
 private:
  JwtVerifier id_token_verifier_;

  bool IsInvalid(const google::protobuf::Map<std::string,
                                             google::protobuf::Value> &fields)
      const;

  absl::optional<google::jwt_verify::Jwt> ParseIDToken(
      const google::protobuf::Map<std::string, google::protobuf::Value>
          &fields) const;

 public:
  explicit TokenResponseParserImpl(JwksResolverPtr resolver);

  std::shared_ptr<TokenResponse> Parse(
      const std::string &client_id,
      const std::string &raw_response_string) const override;
};

}  // namespace login
}  // namespace authbridge

#endif  // AUTHBRIDGE_SRC_LOGIN_TOKEN_RESPONSE_H_
