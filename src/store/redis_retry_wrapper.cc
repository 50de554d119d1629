#include "src/store/redis_retry_wrapper.h"

#include "spdlog/spdlog.h"

namespace authbridge {
namespace store {
namespace {

const int kMaxRetries = 3;

template <typename F>
auto WithRetries(const char *operation, F &&call) -> decltype(call()) {
  for (int retries = 0;; retries++) {
    try {
      return call();
    } catch (const RedisClosedError &err) {
      if (retries < kMaxRetries) {
        spdlog::trace("{}: redis connection closed error, retrying",
                      operation);
        continue;
      }
      spdlog::error("{}: redis connection closed error, throwing error",
                    operation);
      throw RedisError(err.what());
    } catch (const RedisIoError &err) {
      if (retries < kMaxRetries) {
        spdlog::trace("{}: redis connection timed out, retrying", operation);
        continue;
      }
      spdlog::error("{}: redis timed out, throwing error", operation);
      throw RedisError(err.what());
    }
  }
}

}  // namespace

RedisRetryWrapper::RedisRetryWrapper(
    std::shared_ptr<RedisWrapper> redis_wrapper)
    : redis_wrapper_(redis_wrapper) {}

bool RedisRetryWrapper::set(absl::string_view key, absl::string_view val,
                            std::chrono::milliseconds ttl) {
  return WithRetries(__func__,
                     [&]() { return redis_wrapper_->set(key, val, ttl); });
}

absl::optional<std::string> RedisRetryWrapper::get(absl::string_view key) {
  return WithRetries(__func__, [&]() { return redis_wrapper_->get(key); });
}

long long RedisRetryWrapper::del(absl::string_view key) {
  return WithRetries(__func__, [&]() { return redis_wrapper_->del(key); });
}

bool RedisRetryWrapper::update(absl::string_view key,
                               const RedisValueUpdate &update) {
  return WithRetries(__func__,
                     [&]() { return redis_wrapper_->update(key, update); });
}

void RedisRetryWrapper::configSet(absl::string_view parameter,
                                  absl::string_view value) {
  WithRetries(__func__,
              [&]() { redis_wrapper_->configSet(parameter, value); });
}

std::unique_ptr<RedisSubscription> RedisRetryWrapper::subscribe(
    absl::string_view channel) {
  return WithRetries(__func__,
                     [&]() { return redis_wrapper_->subscribe(channel); });
}

int RedisRetryWrapper::db() const { return redis_wrapper_->db(); }

}  // namespace store
}  // namespace authbridge
