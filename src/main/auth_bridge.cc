#include <memory>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/strings/str_cat.h"
#include "spdlog/sinks/stdout_sinks.h"
#include "spdlog/spdlog.h"
#include "src/config/get_config.h"
#include "src/service/auth_bridge_server.h"

using namespace authbridge::config;
using namespace authbridge::service;

ABSL_FLAG(std::string, config, "/etc/authbridge/config.json",
          "path to the server configuration");

int main(int argc, char **argv) {
  absl::SetProgramUsageMessage(
      absl::StrCat("run the login coordination server:\n", argv[0]));
  absl::ParseCommandLine(argc, argv);

  auto console = spdlog::stdout_logger_mt("console");
  spdlog::set_default_logger(console);

  try {
    auto config = GetConfig(absl::GetFlag(FLAGS_config));
    console->set_level(GetConfiguredLogLevel(*config));
    AuthBridgeServer server(*config);
    server.Run();
  } catch (const std::exception &e) {
    spdlog::error("{}: Unexpected error: {}", __func__, e.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
