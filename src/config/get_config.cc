#include "src/config/get_config.h"

#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <sstream>

#include "absl/strings/match.h"
#include "src/common/http/http.h"

using namespace std;
using namespace google::protobuf::util;

namespace authbridge {
namespace config {
namespace {

const char* kDefaultListenAddress = "127.0.0.1";
const char* kDefaultListenPort = "10003";
const int kDefaultThreads = 4;
const char* kDefaultCallbackAddress = "0.0.0.0";
const uint16_t kDefaultCallbackPort = 8080;
const char* kDefaultCallbackPath = "/authorization-code/callback";
const uint32_t kDefaultSessionTtlSeconds = 180;
const uint32_t kDefaultPollIntervalMs = 1000;

}  // namespace

void ConfigValidator::ValidateAll(const Config& config) {
  GetConfiguredLogLevel(config);

  if (config.callback_server().port() > 65535) {
    throw std::runtime_error(
        fmt::format("invalid callback_server.port: {}",
                    config.callback_server().port()));
  }
  const auto& path = config.callback_server().path();
  if (!path.empty() && !absl::StartsWith(path, "/")) {
    throw std::runtime_error(
        fmt::format("invalid callback_server.path: must start with /: {}",
                    path));
  }

  if (config.has_oidc()) {
    ValidateOIDCConfig(config.oidc());
  }
  ValidateSessionStoreConfig(config.session_store());

  const auto& watch = config.watch();
  if (watch.backoff_multiplier() != 0 && watch.backoff_multiplier() < 1) {
    throw std::runtime_error(
        "invalid watch.backoff_multiplier: must not be less than 1");
  }
  if (watch.randomization_factor() < 0 || watch.randomization_factor() > 1) {
    throw std::runtime_error(
        "invalid watch.randomization_factor: must be between 0 and 1");
  }
}

void ConfigValidator::ValidateOIDCConfig(
    const config::oidc::OIDCConfig& config) {
  ValidateUri(config.authorization_uri(), "authorization_uri", false);
  ValidateUri(config.token_uri(), "token_uri", false);
  ValidateUri(config.userinfo_uri(), "userinfo_uri", false);
  ValidateUri(config.callback_uri(), "callback_uri", true);

  if (config.client_id().empty()) {
    throw std::runtime_error("invalid client_id: must not be empty");
  }

  switch (config.jwks_config_case()) {
    case config::oidc::OIDCConfig::kJwks:
      if (config.jwks().empty()) {
        throw std::runtime_error("invalid jwks: must not be empty");
      }
      break;
    case config::oidc::OIDCConfig::kJwksFetcher:
      ValidateUri(config.jwks_fetcher().jwks_uri(), "jwks_fetcher.jwks_uri",
                  false);
      break;
    default:
      throw std::runtime_error(
          "invalid oidc: one of jwks or jwks_fetcher must be set");
  }
}

void ConfigValidator::ValidateSessionStoreConfig(
    const SessionStoreConfig& config) {
  if (config.has_redis()) {
    const auto& server_uri = config.redis().server_uri();
    if (!absl::StartsWith(server_uri, "tcp://") &&
        !absl::StartsWith(server_uri, "unix://")) {
      throw std::runtime_error(fmt::format(
          "invalid session_store.redis.server_uri: must be tcp or unix "
          "scheme: {}",
          server_uri));
    }
  }
}

void ConfigValidator::ValidateUri(absl::string_view uri,
                                  absl::string_view uri_type,
                                  bool allow_http) {
  auto required_scheme = allow_http ? "http or https" : "https";
  std::unique_ptr<common::http::Uri> parsed_uri;
  try {
    parsed_uri = std::make_unique<common::http::Uri>(uri);
  } catch (std::runtime_error& e) {
    if (std::string(e.what()).find("uri must be http or https scheme") !=
        std::string::npos) {
      throw std::runtime_error(
          fmt::format("invalid {}: uri must be {} scheme: {}",
                      std::string(uri_type), required_scheme,
                      std::string(uri)));
    }
    throw std::runtime_error(
        fmt::format("invalid {}: ", std::string(uri_type)) + e.what());
  }
  if (parsed_uri->HasQuery() || parsed_uri->HasFragment()) {
    throw std::runtime_error(
        fmt::format("invalid {}: query params and fragments not allowed: {}",
                    std::string(uri_type), std::string(uri)));
  }
  if (!allow_http && parsed_uri->GetScheme() != "https") {
    throw std::runtime_error(
        fmt::format("invalid {}: uri must be {} scheme: {}",
                    std::string(uri_type), required_scheme,
                    std::string(uri)));
  }
}

spdlog::level::level_enum GetConfiguredLogLevel(const Config& config) {
  auto log_level_string = config.log_level();
  spdlog::level::level_enum level;

  if (log_level_string == "trace" || log_level_string.empty()) {
    level = spdlog::level::level_enum::trace;
  } else if (log_level_string == "debug") {
    level = spdlog::level::level_enum::debug;
  } else if (log_level_string == "info") {
    level = spdlog::level::level_enum::info;
  } else if (log_level_string == "warn") {
    level = spdlog::level::level_enum::warn;
  } else if (log_level_string == "error") {
    level = spdlog::level::level_enum::err;
  } else if (log_level_string == "critical") {
    level = spdlog::level::level_enum::critical;
  } else {
    throw std::runtime_error(fmt::format(
        "invalid log_level: '{}' must be one of [trace, debug, info, warn, "
        "error, critical]",
        log_level_string));
  }

  return level;
}

unique_ptr<Config> GetConfig(const string& configFileName) {
  ifstream configFile(configFileName);
  if (!configFile) {
    throw runtime_error(
        fmt::format("failed to open config file: {}", configFileName));
  }
  stringstream buf;
  buf << configFile.rdbuf();
  configFile.close();

  unique_ptr<Config> config(new Config);
  auto status = JsonStringToMessage(buf.str(), config.get());
  if (!status.ok()) {
    throw runtime_error(std::string(status.message()));
  }

  ConfigValidator::ValidateAll(*config);

  return config;
}

std::string GetListenAddress(const Config& config) {
  return config.listen_address().empty() ? kDefaultListenAddress
                                         : config.listen_address();
}

std::string GetListenPort(const Config& config) {
  return config.listen_port().empty() ? kDefaultListenPort
                                      : config.listen_port();
}

int GetThreads(const Config& config) {
  return config.threads() == 0 ? kDefaultThreads : config.threads();
}

std::string GetCallbackAddress(const Config& config) {
  return config.callback_server().address().empty()
             ? kDefaultCallbackAddress
             : config.callback_server().address();
}

uint16_t GetCallbackPort(const Config& config) {
  return config.callback_server().port() == 0
             ? kDefaultCallbackPort
             : static_cast<uint16_t>(config.callback_server().port());
}

std::string GetCallbackPath(const Config& config) {
  return config.callback_server().path().empty()
             ? kDefaultCallbackPath
             : config.callback_server().path();
}

std::chrono::seconds GetSessionTtl(const Config& config) {
  auto ttl = config.session_store().session_ttl_seconds();
  return std::chrono::seconds(ttl == 0 ? kDefaultSessionTtlSeconds : ttl);
}

common::utilities::BackOffPolicy GetWatchBackOffPolicy(const Config& config) {
  common::utilities::BackOffPolicy policy;
  const auto& watch = config.watch();
  if (watch.initial_backoff_ms() != 0) {
    policy.initial_interval =
        std::chrono::milliseconds(watch.initial_backoff_ms());
  }
  if (watch.max_backoff_ms() != 0) {
    policy.max_interval = std::chrono::milliseconds(watch.max_backoff_ms());
  }
  if (watch.max_elapsed_ms() != 0) {
    policy.max_elapsed = std::chrono::milliseconds(watch.max_elapsed_ms());
  }
  if (watch.backoff_multiplier() != 0) {
    policy.multiplier = watch.backoff_multiplier();
  }
  if (watch.randomization_factor() != 0) {
    policy.randomization_factor = watch.randomization_factor();
  }
  return policy;
}

int GetWatchPollInterval(const Config& config) {
  auto interval = config.watch().poll_interval_ms();
  return interval == 0 ? kDefaultPollIntervalMs : interval;
}

}  // namespace config
}  // namespace authbridge
