#ifndef AUTHBRIDGE_SRC_CONFIG_GET_CONFIG_H_
#define AUTHBRIDGE_SRC_CONFIG_GET_CONFIG_H_

#include <chrono>
#include <memory>
#include <string>

#include "absl/strings/string_view.h"
#include "config/config.pb.h"
#include "config/oidc/config.pb.h"
#include "spdlog/spdlog.h"
#include "src/common/utilities/backoff.h"

namespace authbridge {
namespace config {

class ConfigValidator {
 public:
  static void ValidateAll(const Config& config);

 private:
  static void ValidateOIDCConfig(const config::oidc::OIDCConfig& config);
  static void ValidateSessionStoreConfig(const SessionStoreConfig& config);
  static void ValidateUri(absl::string_view uri, absl::string_view uri_type,
                          bool allow_http);
};

/**
 * @throws std::runtime_error when log_level is not a known level.
 */
spdlog::level::level_enum GetConfiguredLogLevel(const Config& config);

std::unique_ptr<Config> GetConfig(const std::string& configFile);

std::string GetListenAddress(const Config& config);

std::string GetListenPort(const Config& config);

int GetThreads(const Config& config);

std::string GetCallbackAddress(const Config& config);

uint16_t GetCallbackPort(const Config& config);

std::string GetCallbackPath(const Config& config);

std::chrono::seconds GetSessionTtl(const Config& config);

common::utilities::BackOffPolicy GetWatchBackOffPolicy(const Config& config);

int GetWatchPollInterval(const Config& config);

}  // namespace config
}  // namespace authbridge

#endif  // AUTHBRIDGE_SRC_CONFIG_GET_CONFIG_H_
