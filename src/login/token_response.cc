#include "src/login/token_response.h"

#include "absl/strings/match.h"
#include "google/protobuf/util/json_util.h"
#include "jwt_verify_lib/struct_utils.h"
#include "spdlog/spdlog.h"

namespace authbridge {
namespace login {
namespace {
const char *nonce_field = "nonce";
const char *token_type_field = "token_type";
const char *bearer_token_type = "bearer";
const char *id_token_field = "id_token";
const char *access_token_field = "access_token";
const char *expires_in_field = "expires_in";
}  // namespace

TokenResponse::TokenResponse(const google::jwt_verify::Jwt &id_token)
    : id_token_(id_token) {}

void TokenResponse::SetAccessToken(absl::string_view access_token) {
  access_token_ = std::string(access_token.data(), access_token.size());
}

const google::jwt_verify::Jwt &TokenResponse::IDToken() const {
  return id_token_;
}

absl::optional<std::string> TokenResponse::AccessToken() const {
  if (!access_token_.empty()) {
    return access_token_;
  }
  return absl::nullopt;
}

absl::optional<std::string> TokenResponse::Nonce() const {
  google::jwt_verify::StructUtils getter(id_token_.payload_pb_);
  std::string nonce;
  if (getter.GetString(nonce_field, &nonce) !=
      google::jwt_verify::StructUtils::OK) {
    return absl::nullopt;
  }
  return nonce;
}

TokenResponseParserImpl::TokenResponseParserImpl(JwksResolverPtr resolver)
    : id_token_verifier_(resolver) {}

std::shared_ptr<TokenResponse> TokenResponseParserImpl::Parse(
    const std::string &client_id,
    const std::string &raw_response_string) const {
  ::google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  options.case_insensitive_enum_parsing = false;
  ::google::protobuf::Struct message;

  const auto status = ::google::protobuf::util::JsonStringToMessage(
      raw_response_string, &message, options);
  if (!status.ok()) {
    spdlog::warn("{}: JSON parsing error: {}", __func__,
                 std::string(status.message()));
    return nullptr;
  }

  const auto &fields = message.fields();
  if (IsInvalid(fields)) {
    return nullptr;
  }

  auto id_token = ParseIDToken(fields);
  if (!id_token.has_value()) {
    return nullptr;
  }

  // Verify the token signature & that our client_id is set as an entry in
  // the token's `aud` field.
  auto verify_status = id_token_verifier_.verify(*id_token, {client_id});
  if (!verify_status.ok()) {
    spdlog::warn("{}: invalid `id_token`: {}", __func__,
                 verify_status.ToString());
    return nullptr;
  }

  auto result = std::make_shared<TokenResponse>(*id_token);
  auto access_token_iter = fields.find(access_token_field);
  if (access_token_iter != fields.end()) {
    result->SetAccessToken(access_token_iter->second.string_value());
  }
  return result;
}

absl::optional<google::jwt_verify::Jwt> TokenResponseParserImpl::ParseIDToken(
    const google::protobuf::Map<std::string, google::protobuf::Value> &fields)
    const {
  google::jwt_verify::Jwt id_token;
  // There must be an id_token
  auto id_token_str = fields.find(id_token_field);
  if (id_token_str == fields.end() ||
      id_token_str->second.kind_case() !=
          google::protobuf::Value::kStringValue) {
    spdlog::warn("{}: missing or invalid `id_token` in token response",
                 __func__);
    return absl::nullopt;
  }
  auto jwt_status =
      id_token.parseFromString(id_token_str->second.string_value());
  if (jwt_status != google::jwt_verify::Status::Ok) {
    spdlog::warn("{}: failed to parse `id_token` into a JWT: {}", __func__,
                 google::jwt_verify::getStatusString(jwt_status));
    return absl::nullopt;
  }
  return id_token;
}

bool TokenResponseParserImpl::IsInvalid(
    const google::protobuf::Map<std::string, google::protobuf::Value> &fields)
    const {
  // https://openid.net/specs/openid-connect-core-1_0.html#TokenResponse
  // token_type must be Bearer
  auto token_type = fields.find(token_type_field);
  if (token_type == fields.end() ||
      !(absl::EqualsIgnoreCase(token_type->second.string_value(),
                               bearer_token_type))) {
    spdlog::warn("{}: missing or incorrect `token_type` in token response",
                 __func__);
    return true;
  }

  auto expires_in_iter = fields.find(expires_in_field);
  if (expires_in_iter != fields.end()) {
    auto expires_in = int64_t(expires_in_iter->second.number_value());
    if (expires_in <= 0) {
      spdlog::warn("{}: invalid `expires_in` token response field", __func__);
      return true;
    }
  }

  return false;
}

}  // namespace login
}  // namespace authbridge
