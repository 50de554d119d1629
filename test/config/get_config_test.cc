#include "src/config/get_config.h"

#include <unistd.h>

#include <cstdio>
#include <ctime>
#include <fstream>

#include "google/protobuf/util/json_util.h"
#include "gtest/gtest.h"
#include "test/shared/assertions.h"

namespace authbridge {
namespace config {

using test_helpers::ASSERT_THROWS_STD_RUNTIME_ERROR;

class GetConfigTest : public ::testing::Test {
 protected:
  // Note that the json '{' and '}' are doubled to escape them in usages of
  // fmt::format below
  const char *minimal_valid_config = R"JSON(
  {{
    "oidc":
    {{
      "authorization_uri": "{}",
      "token_uri": "{}",
      "userinfo_uri": "{}",
      "callback_uri": "{}",
      "client_id": "fake-client-id",
      "client_secret": "fake-client-secret",
      "jwks": "fake-jwks"
    }}
  }}
  )JSON";

  std::string tmp_filename;

  virtual void SetUp() {
    auto pid = ::getpid();
    auto time = ::time(nullptr);
    tmp_filename = "/tmp/test." + std::to_string(pid) + "_" +
                   std::to_string(time) + ".json";
  }

  virtual void TearDown() { std::remove(tmp_filename.c_str()); }

  void write_test_file(const std::string &json_string) {
    std::ofstream stream;
    stream.open(tmp_filename);
    stream << json_string;
    stream.close();
  }

  void write_oidc_config(const std::string &authorization_uri,
                         const std::string &token_uri,
                         const std::string &userinfo_uri,
                         const std::string &callback_uri) {
    write_test_file(fmt::format(minimal_valid_config, authorization_uri,
                                token_uri, userinfo_uri, callback_uri));
  }
};

TEST_F(GetConfigTest, ReturnsTheConfig) {
  auto config = GetConfig("test/fixtures/valid-config.json");
  const oidc::OIDCConfig &oidc = config->oidc();

  ASSERT_EQ(GetListenAddress(*config), "0.0.0.0");
  ASSERT_EQ(GetListenPort(*config), "10005");
  ASSERT_EQ(GetConfiguredLogLevel(*config), spdlog::level::info);
  ASSERT_EQ(GetThreads(*config), 8);

  ASSERT_EQ(GetCallbackAddress(*config), "127.0.0.1");
  ASSERT_EQ(GetCallbackPort(*config), 9090);
  ASSERT_EQ(GetCallbackPath(*config), "/oauth/callback");

  ASSERT_EQ(oidc.name(), "example");
  ASSERT_EQ(oidc.authorization_uri(), "https://idp.example.com/authorize");
  ASSERT_EQ(oidc.token_uri(), "https://idp.example.com/token");
  ASSERT_EQ(oidc.userinfo_uri(), "https://idp.example.com/userinfo");
  ASSERT_EQ(oidc.callback_uri(), "http://localhost:9090/oauth/callback");
  ASSERT_EQ(oidc.client_id(), "foo");
  ASSERT_EQ(oidc.client_secret(), "bar");
  ASSERT_EQ(oidc.scopes().size(), 1);
  ASSERT_EQ(oidc.scopes().at(0), "email");
  ASSERT_EQ(oidc.trusted_certificate_authority(), "ca_placeholder");
  ASSERT_EQ(oidc.jwks_fetcher().jwks_uri(), "https://idp.example.com/keys");
  ASSERT_EQ(oidc.jwks_fetcher().periodic_fetch_interval_sec(), 300);

  ASSERT_EQ(GetSessionTtl(*config), std::chrono::seconds(240));
  ASSERT_TRUE(config->session_store().has_redis());
  ASSERT_EQ(config->session_store().redis().server_uri(),
            "tcp://127.0.0.1:6379/2");
  ASSERT_TRUE(config->session_store().redis().enable_keyspace_notifications());

  auto policy = GetWatchBackOffPolicy(*config);
  ASSERT_EQ(policy.initial_interval, std::chrono::milliseconds(100));
  ASSERT_EQ(policy.max_interval, std::chrono::milliseconds(2000));
  ASSERT_EQ(policy.max_elapsed, std::chrono::milliseconds(30000));
  ASSERT_DOUBLE_EQ(policy.multiplier, 2.0);
  ASSERT_DOUBLE_EQ(policy.randomization_factor, 0.25);
  ASSERT_EQ(GetWatchPollInterval(*config), 250);
}

TEST_F(GetConfigTest, AppliesDefaults) {
  write_test_file("{}");
  auto config = GetConfig(tmp_filename);

  ASSERT_FALSE(config->has_oidc());
  ASSERT_EQ(GetListenAddress(*config), "127.0.0.1");
  ASSERT_EQ(GetListenPort(*config), "10003");
  ASSERT_EQ(GetConfiguredLogLevel(*config), spdlog::level::trace);
  ASSERT_EQ(GetThreads(*config), 4);
  ASSERT_EQ(GetCallbackAddress(*config), "0.0.0.0");
  ASSERT_EQ(GetCallbackPort(*config), 8080);
  ASSERT_EQ(GetCallbackPath(*config), "/authorization-code/callback");
  ASSERT_EQ(GetSessionTtl(*config), std::chrono::seconds(180));
  ASSERT_FALSE(config->session_store().has_redis());

  auto policy = GetWatchBackOffPolicy(*config);
  ASSERT_EQ(policy.initial_interval, std::chrono::milliseconds(500));
  ASSERT_EQ(policy.max_interval, std::chrono::milliseconds(10000));
  ASSERT_EQ(policy.max_elapsed, std::chrono::milliseconds(60000));
  ASSERT_DOUBLE_EQ(policy.multiplier, 1.5);
  ASSERT_DOUBLE_EQ(policy.randomization_factor, 0.5);
  ASSERT_EQ(GetWatchPollInterval(*config), 1000);
}

TEST_F(GetConfigTest, ThrowsForMissingFile) {
  ASSERT_THROWS_STD_RUNTIME_ERROR(
      [] { GetConfig("/tmp/does-not-exist.json"); },
      "failed to open config file: /tmp/does-not-exist.json");
}

TEST_F(GetConfigTest, ThrowsForUnknownFields) {
  write_test_file(R"JSON(
    {
      "chains": []
    }
  )JSON");

  EXPECT_THROW(GetConfig(tmp_filename), std::runtime_error);
}

TEST_F(GetConfigTest, ValidatesTheLogLevel) {
  write_test_file(R"JSON({"log_level": "verbose"})JSON");
  ASSERT_THROWS_STD_RUNTIME_ERROR(
      [this] { GetConfig(tmp_filename); },
      "invalid log_level: 'verbose' must be one of [trace, debug, info, warn, "
      "error, critical]");

  for (const auto &level :
       {"trace", "debug", "info", "warn", "error", "critical"}) {
    write_test_file(fmt::format(R"JSON({{"log_level": "{}"}})JSON", level));
    ASSERT_NO_THROW(GetConfig(tmp_filename));
  }
}

TEST_F(GetConfigTest, ValidatesTheUris) {
  write_oidc_config("https://foo", "https://bar", "https://qux",
                    "https://baz");
  ASSERT_NO_THROW(GetConfig(tmp_filename));

  write_oidc_config("https://foo", "https://bar", "https://qux",
                    "http://localhost:8080/callback");
  ASSERT_NO_THROW(GetConfig(tmp_filename));

  write_oidc_config("invalid", "https://bar", "https://qux", "https://baz");
  ASSERT_THROWS_STD_RUNTIME_ERROR(
      [this] { GetConfig(tmp_filename); },
      "invalid authorization_uri: uri must be https scheme: invalid");

  write_oidc_config("http://foo", "https://bar", "https://qux",
                    "https://baz");
  ASSERT_THROWS_STD_RUNTIME_ERROR(
      [this] { GetConfig(tmp_filename); },
      "invalid authorization_uri: uri must be https scheme: http://foo");

  write_oidc_config("https://foo", "invalid", "https://qux", "https://baz");
  ASSERT_THROWS_STD_RUNTIME_ERROR(
      [this] { GetConfig(tmp_filename); },
      "invalid token_uri: uri must be https scheme: invalid");

  write_oidc_config("https://foo", "https://bar", "invalid", "https://baz");
  ASSERT_THROWS_STD_RUNTIME_ERROR(
      [this] { GetConfig(tmp_filename); },
      "invalid userinfo_uri: uri must be https scheme: invalid");

  write_oidc_config("https://foo", "https://bar", "https://qux", "invalid");
  ASSERT_THROWS_STD_RUNTIME_ERROR(
      [this] { GetConfig(tmp_filename); },
      "invalid callback_uri: uri must be http or https scheme: invalid");

  write_oidc_config("https://foo?q=2", "https://bar", "https://qux",
                    "https://baz");
  ASSERT_THROWS_STD_RUNTIME_ERROR([this] { GetConfig(tmp_filename); },
                                  "invalid authorization_uri: query params and "
                                  "fragments not allowed: https://foo?q=2");

  write_oidc_config("https://foo", "https://bar#2", "https://qux",
                    "https://baz");
  ASSERT_THROWS_STD_RUNTIME_ERROR([this] { GetConfig(tmp_filename); },
                                  "invalid token_uri: query params and "
                                  "fragments not allowed: https://bar#2");

  write_oidc_config("https://foo", "https://bar", "https://qux",
                    "https://baz?q=2");
  ASSERT_THROWS_STD_RUNTIME_ERROR([this] { GetConfig(tmp_filename); },
                                  "invalid callback_uri: query params and "
                                  "fragments not allowed: https://baz?q=2");

  write_oidc_config("https://foo", "https://bar:99999", "https://qux",
                    "https://baz");
  ASSERT_THROWS_STD_RUNTIME_ERROR(
      [this] { GetConfig(tmp_filename); },
      "invalid token_uri: port value must be between 0 and 65535: "
      "https://bar:99999");
}

TEST_F(GetConfigTest, RequiresClientIdAndJwks) {
  write_test_file(R"JSON(
    {
      "oidc": {
        "authorization_uri": "https://foo",
        "token_uri": "https://bar",
        "userinfo_uri": "https://qux",
        "callback_uri": "https://baz",
        "jwks": "fake-jwks"
      }
    }
  )JSON");
  ASSERT_THROWS_STD_RUNTIME_ERROR([this] { GetConfig(tmp_filename); },
                                  "invalid client_id: must not be empty");

  write_test_file(R"JSON(
    {
      "oidc": {
        "authorization_uri": "https://foo",
        "token_uri": "https://bar",
        "userinfo_uri": "https://qux",
        "callback_uri": "https://baz",
        "client_id": "id"
      }
    }
  )JSON");
  ASSERT_THROWS_STD_RUNTIME_ERROR(
      [this] { GetConfig(tmp_filename); },
      "invalid oidc: one of jwks or jwks_fetcher must be set");

  write_test_file(R"JSON(
    {
      "oidc": {
        "authorization_uri": "https://foo",
        "token_uri": "https://bar",
        "userinfo_uri": "https://qux",
        "callback_uri": "https://baz",
        "client_id": "id",
        "jwks_fetcher": {"jwks_uri": "http://keys"}
      }
    }
  )JSON");
  ASSERT_THROWS_STD_RUNTIME_ERROR(
      [this] { GetConfig(tmp_filename); },
      "invalid jwks_fetcher.jwks_uri: uri must be https scheme: http://keys");
}

TEST_F(GetConfigTest, ValidatesTheSessionStore) {
  write_test_file(R"JSON(
    {"session_store": {"redis": {"server_uri": "tcp://127.0.0.1:6379"}}}
  )JSON");
  ASSERT_NO_THROW(GetConfig(tmp_filename));

  write_test_file(R"JSON(
    {"session_store": {"redis": {"server_uri": "unix:///run/redis.sock"}}}
  )JSON");
  ASSERT_NO_THROW(GetConfig(tmp_filename));

  write_test_file(R"JSON(
    {"session_store": {"redis": {"server_uri": "redis://127.0.0.1"}}}
  )JSON");
  ASSERT_THROWS_STD_RUNTIME_ERROR(
      [this] { GetConfig(tmp_filename); },
      "invalid session_store.redis.server_uri: must be tcp or unix scheme: "
      "redis://127.0.0.1");

  write_test_file(R"JSON({"session_store": {"in_memory": {}}})JSON");
  ASSERT_NO_THROW(GetConfig(tmp_filename));
}

TEST_F(GetConfigTest, ValidatesTheCallbackServer) {
  write_test_file(R"JSON({"callback_server": {"path": "callback"}})JSON");
  ASSERT_THROWS_STD_RUNTIME_ERROR(
      [this] { GetConfig(tmp_filename); },
      "invalid callback_server.path: must start with /: callback");

  write_test_file(R"JSON({"callback_server": {"port": 70000}})JSON");
  ASSERT_THROWS_STD_RUNTIME_ERROR([this] { GetConfig(tmp_filename); },
                                  "invalid callback_server.port: 70000");
}

TEST_F(GetConfigTest, ValidatesTheWatchPolicy) {
  write_test_file(R"JSON({"watch": {"backoff_multiplier": 0.5}})JSON");
  ASSERT_THROWS_STD_RUNTIME_ERROR(
      [this] { GetConfig(tmp_filename); },
      "invalid watch.backoff_multiplier: must not be less than 1");

  write_test_file(R"JSON({"watch": {"randomization_factor": 1.5}})JSON");
  ASSERT_THROWS_STD_RUNTIME_ERROR(
      [this] { GetConfig(tmp_filename); },
      "invalid watch.randomization_factor: must be between 0 and 1");
}

}  // namespace config
}  // namespace authbridge
