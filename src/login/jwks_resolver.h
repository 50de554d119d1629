#ifndef AUTHBRIDGE_SRC_LOGIN_JWKS_RESOLVER_H_
#define AUTHBRIDGE_SRC_LOGIN_JWKS_RESOLVER_H_

#include <spdlog/spdlog.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <memory>

#include "absl/synchronization/mutex.h"
#include "config/oidc/config.pb.h"
#include "jwt_verify_lib/jwks.h"
#include "src/common/http/http.h"

namespace authbridge {
namespace login {

typedef std::shared_ptr<const google::jwt_verify::Jwks> SharedJwks;

/**
 * Provides the key set ID tokens are verified against.
 */
class JwksResolver {
 public:
  virtual ~JwksResolver() = default;

  /**
   * @return the current key set, or null when none has been loaded.
   */
  virtual SharedJwks jwks() = 0;

 protected:
  static SharedJwks parseJwks(const std::string& jwks) {
    auto jwks_keys = google::jwt_verify::Jwks::createFrom(
        jwks, google::jwt_verify::Jwks::JWKS);
    if (jwks_keys->getStatus() != google::jwt_verify::Status::Ok) {
      spdlog::warn("{}: failed to parse JWKs, {}", __func__,
                   google::jwt_verify::getStatusString(jwks_keys->getStatus()));
      return nullptr;
    }
    return SharedJwks(std::move(jwks_keys));
  }
};

typedef std::shared_ptr<JwksResolver> JwksResolverPtr;

class StaticJwksResolverImpl : public JwksResolver {
 public:
  explicit StaticJwksResolverImpl(const std::string& jwks)
      : jwks_(parseJwks(jwks)) {}

  SharedJwks jwks() override { return jwks_; }

 private:
  SharedJwks jwks_;
};

/**
 * Fetches the key set from the provider periodically. Until the first fetch
 * succeeds it is retried every few seconds.
 */
class DynamicJwksResolverImpl : public JwksResolver {
 public:
  DynamicJwksResolverImpl(const std::string& jwks_uri,
                          std::chrono::seconds fetch_interval,
                          std::string trusted_certificate_authority,
                          common::http::ptr_t http_ptr,
                          boost::asio::io_context& ioc);

  void updateJwks(const std::string& new_jwks);

  SharedJwks jwks() override;

  // Stop fetching. Pending fetches are abandoned.
  void Stop();

 private:
  void schedule(std::chrono::seconds delay);
  void request();

  const std::string jwks_uri_;
  const std::chrono::seconds fetch_interval_;
  const std::string trusted_certificate_authority_;
  common::http::ptr_t http_ptr_;
  boost::asio::io_context& ioc_;
  boost::asio::steady_timer timer_;
  SharedJwks jwks_ ABSL_GUARDED_BY(mux_);
  absl::Mutex mux_;
};

/**
 * Create the resolver the configuration asks for.
 */
JwksResolverPtr CreateJwksResolver(const config::oidc::OIDCConfig& config,
                                   common::http::ptr_t http_ptr,
                                   boost::asio::io_context& ioc);

}  // namespace login
}  // namespace authbridge

#endif  // AUTHBRIDGE_SRC_LOGIN_JWKS_RESOLVER_H_
