#include "src/store/redis_wrapper.h"

#include <deque>

namespace authbridge {
namespace store {
namespace {

sw::redis::StringView View(absl::string_view value) {
  return sw::redis::StringView(value.data(), value.size());
}

// Run a redis++ call, rethrowing its errors as RedisErrors.
template <typename F>
auto Translate(F &&call) -> decltype(call()) {
  try {
    return call();
  } catch (const sw::redis::ClosedError &err) {
    throw RedisClosedError(err.what());
  } catch (const sw::redis::IoError &err) {
    throw RedisIoError(err.what());
  } catch (const sw::redis::Error &err) {
    throw RedisError(err.what());
  }
}

class RedisSubscriptionImpl : public RedisSubscription {
 public:
  RedisSubscriptionImpl(sw::redis::Subscriber subscriber,
                        absl::string_view channel)
      : subscriber_(std::move(subscriber)) {
    subscriber_.on_message([this](std::string, std::string message) {
      messages_.push_back(std::move(message));
    });
    subscriber_.subscribe(View(channel));
  }

  absl::optional<std::string> consume() override {
    return Translate([this]() -> absl::optional<std::string> {
      while (messages_.empty()) {
        try {
          subscriber_.consume();
        } catch (const sw::redis::TimeoutError &) {
          return absl::nullopt;
        }
      }
      auto message = std::move(messages_.front());
      messages_.pop_front();
      return message;
    });
  }

 private:
  sw::redis::Subscriber subscriber_;
  std::deque<std::string> messages_;
};

}  // namespace

RedisWrapper::RedisWrapper(absl::string_view redis_server_uri,
                           unsigned int threads, int subscribe_timeout_ms)
    : connection_options_(std::string(redis_server_uri)),
      pool_options_(),
      redis_(fillInConnectionOptions(connection_options_, false, 10000, 10000),
             fillInPoolOptions(pool_options_, threads, 10000, 0)),
      subscriber_connection_options_(std::string(redis_server_uri)),
      subscriber_redis_(
          fillInConnectionOptions(subscriber_connection_options_, true, 10000,
                                  subscribe_timeout_ms),
          sw::redis::ConnectionPoolOptions()) {}

sw::redis::ConnectionOptions &RedisWrapper::fillInConnectionOptions(
    sw::redis::ConnectionOptions &connection_options, bool keep_alive,
    int connect_timeout_ms, int socket_timeout_ms) {
  connection_options.keep_alive = keep_alive;
  connection_options.connect_timeout =
      std::chrono::milliseconds(connect_timeout_ms);
  connection_options.socket_timeout =
      std::chrono::milliseconds(socket_timeout_ms);
  return connection_options;
}

sw::redis::ConnectionPoolOptions &RedisWrapper::fillInPoolOptions(
    sw::redis::ConnectionPoolOptions &pool_options, std::size_t pool_size,
    int wait_timeout_ms, int connection_lifetime_ms) {
  pool_options.size = pool_size;
  pool_options.wait_timeout = std::chrono::milliseconds(wait_timeout_ms);
  pool_options.connection_lifetime =
      std::chrono::milliseconds(connection_lifetime_ms);
  return pool_options;
}

bool RedisWrapper::set(absl::string_view key, absl::string_view val,
                       std::chrono::milliseconds ttl) {
  return Translate([&]() { return redis_.set(View(key), View(val), ttl); });
}

absl::optional<std::string> RedisWrapper::get(absl::string_view key) {
  return Translate([&]() -> absl::optional<std::string> {
    auto value = redis_.get(View(key));
    if (!value) {
      return absl::nullopt;
    }
    return *value;
  });
}

long long RedisWrapper::del(absl::string_view key) {
  return Translate([&]() { return redis_.del(View(key)); });
}

bool RedisWrapper::update(absl::string_view key,
                          const RedisValueUpdate &update) {
  return Translate([&]() {
    try {
      // A transaction runs on a connection of its own, so the WATCH ends with
      // it.
      auto transaction = redis_.transaction();
      auto connection = transaction.redis();
      connection.watch(View(key));
      auto stored = connection.get(View(key));
      auto pttl = connection.pttl(View(key));

      absl::optional<std::string> current;
      if (stored) {
        current = *stored;
      }
      auto updated = update(current);
      if (!updated.has_value()) {
        return true;
      }

      if (pttl > 0) {
        transaction.set(View(key), View(*updated),
                        std::chrono::milliseconds(pttl));
      } else {
        transaction.set(View(key), View(*updated));
      }
      transaction.exec();
      return true;
    } catch (const sw::redis::WatchError &) {
      return false;
    }
  });
}

void RedisWrapper::configSet(absl::string_view parameter,
                             absl::string_view value) {
  Translate([&]() {
    redis_.command("CONFIG", "SET", View(parameter), View(value));
  });
}

std::unique_ptr<RedisSubscription> RedisWrapper::subscribe(
    absl::string_view channel) {
  return Translate([&]() {
    return std::unique_ptr<RedisSubscription>(
        new RedisSubscriptionImpl(subscriber_redis_.subscriber(), channel));
  });
}

int RedisWrapper::db() const { return connection_options_.db; }

}  // namespace store
}  // namespace authbridge
