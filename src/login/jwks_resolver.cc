#include "src/login/jwks_resolver.h"

#include <boost/asio/spawn.hpp>

namespace authbridge {
namespace login {

namespace {
constexpr uint32_t kJwksInitialFetchDelaySec = 3;
constexpr uint32_t kJwksPeriodicFetchIntervalSec = 1200;
}  // namespace

DynamicJwksResolverImpl::DynamicJwksResolverImpl(
    const std::string& jwks_uri, std::chrono::seconds fetch_interval,
    std::string trusted_certificate_authority, common::http::ptr_t http_ptr,
    boost::asio::io_context& ioc)
    : jwks_uri_(jwks_uri),
      fetch_interval_(fetch_interval),
      trusted_certificate_authority_(std::move(trusted_certificate_authority)),
      http_ptr_(http_ptr),
      ioc_(ioc),
      timer_(ioc) {
  schedule(std::chrono::seconds(0));
}

void DynamicJwksResolverImpl::updateJwks(const std::string& new_jwks) {
  auto parsed = parseJwks(new_jwks);
  if (parsed == nullptr) {
    spdlog::info("{}: keeping the previous JWKs", __func__);
    return;
  }
  absl::MutexLock lck(&mux_);
  jwks_ = std::move(parsed);
}

SharedJwks DynamicJwksResolverImpl::jwks() {
  absl::ReaderMutexLock lck(&mux_);
  return jwks_;
}

void DynamicJwksResolverImpl::Stop() { timer_.cancel(); }

void DynamicJwksResolverImpl::schedule(std::chrono::seconds delay) {
  timer_.expires_after(delay);
  timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    request();
  });
}

void DynamicJwksResolverImpl::request() {
  boost::asio::spawn(ioc_, [this](boost::asio::yield_context yield) {
    auto resp = http_ptr_->Get(jwks_uri_, {}, trusted_certificate_authority_,
                               ioc_, yield);
    if (resp == nullptr) {
      spdlog::warn("{}: HTTP connection error", __func__);
    } else if (resp->result() != boost::beast::http::status::ok) {
      spdlog::warn("{}: HTTP response error: {}", __func__,
                   resp->result_int());
    } else {
      updateJwks(resp->body());
    }

    // A failed first fetch would otherwise leave ID tokens unverifiable for a
    // whole interval.
    auto next = jwks() == nullptr
                    ? std::chrono::seconds(kJwksInitialFetchDelaySec)
                    : fetch_interval_;
    schedule(next);
  });
}

JwksResolverPtr CreateJwksResolver(const config::oidc::OIDCConfig& config,
                                   common::http::ptr_t http_ptr,
                                   boost::asio::io_context& ioc) {
  switch (config.jwks_config_case()) {
    case config::oidc::OIDCConfig::kJwks:
      return std::make_shared<StaticJwksResolverImpl>(config.jwks());
    case config::oidc::OIDCConfig::kJwksFetcher: {
      uint32_t periodic_fetch_interval_sec =
          config.jwks_fetcher().periodic_fetch_interval_sec();
      if (periodic_fetch_interval_sec == 0) {
        periodic_fetch_interval_sec = kJwksPeriodicFetchIntervalSec;
      }
      return std::make_shared<DynamicJwksResolverImpl>(
          config.jwks_fetcher().jwks_uri(),
          std::chrono::seconds(periodic_fetch_interval_sec),
          config.trusted_certificate_authority(), http_ptr, ioc);
    }
    default:
      throw std::runtime_error("invalid JWKs config type");
  }
}

}  // namespace login
}  // namespace authbridge
