#include "src/login/login_session_initiator.h"

#include "absl/strings/str_cat.h"
#include "spdlog/spdlog.h"
#include "src/login/errors.h"

namespace authbridge {
namespace login {

LoginSessionInitiator::LoginSessionInitiator(
    OidcClientPtr oidc_client, SessionStorePtr session_store,
    common::session::SessionStringGeneratorPtr generator,
    std::chrono::seconds session_ttl)
    : oidc_client_(oidc_client),
      session_store_(session_store),
      generator_(generator),
      session_ttl_(session_ttl) {}

absl::StatusOr<LoginStart> LoginSessionInitiator::BeginLogin() {
  if (oidc_client_ == nullptr) {
    spdlog::warn("{}: no identity provider configured", __func__);
    return NotConfiguredError("no identity provider configured");
  }

  auto state = generator_->GenerateState();
  auto nonce = generator_->GenerateNonce();
  auto status = session_store_->CreatePending(state, nonce, session_ttl_);
  if (!status.ok()) {
    spdlog::error("{}: failed to create login session (state token: {}): {}",
                  __func__, state, status.ToString());
    return StoreUnavailableError(
        absl::StrCat("failed to create login session: ", status.message()));
  }

  spdlog::info("{}: created login session (state token: {})", __func__,
               state);
  return LoginStart{oidc_client_->AuthorizationUrl(state, nonce), state};
}

}  // namespace login
}  // namespace authbridge
