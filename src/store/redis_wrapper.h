#ifndef AUTHBRIDGE_SRC_STORE_REDIS_WRAPPER_H_
#define AUTHBRIDGE_SRC_STORE_REDIS_WRAPPER_H_

#include <sw/redis++/redis++.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include "src/store/coordination_store.h"

namespace authbridge {
namespace store {

class RedisError : public StoreError {
 public:
  using StoreError::StoreError;
};

class RedisClosedError : public RedisError {
 public:
  using RedisError::RedisError;
};

class RedisIoError : public RedisError {
 public:
  using RedisError::RedisError;
};

/**
 * A subscription to a single pub/sub channel.
 */
class RedisSubscription {
 public:
  virtual ~RedisSubscription() = default;

  /**
   * Wait for the next message published on the channel.
   * @return the message, or nullopt when none arrived within the
   * subscription's timeout.
   */
  virtual absl::optional<std::string> consume() = 0;
};

// Computes the new value of a key from its current value. nullopt means no
// write.
using RedisValueUpdate = std::function<absl::optional<std::string>(
    const absl::optional<std::string> &)>;

class RedisWrapper {
 private:
  sw::redis::ConnectionOptions connection_options_;
  sw::redis::ConnectionPoolOptions pool_options_;
  sw::redis::Redis redis_;
  sw::redis::ConnectionOptions subscriber_connection_options_;
  sw::redis::Redis subscriber_redis_;

  static sw::redis::ConnectionOptions &fillInConnectionOptions(
      sw::redis::ConnectionOptions &connection_options, bool keep_alive,
      int connect_timeout_ms, int socket_timeout_ms);

  static sw::redis::ConnectionPoolOptions &fillInPoolOptions(
      sw::redis::ConnectionPoolOptions &pool_options, std::size_t pool_size,
      int wait_timeout_ms, int connection_lifetime_ms);

 public:
  /**
   * @param redis_server_uri of the form
   * tcp://[[username:]password@]host[:port][/db] or unix://path
   * @param threads the size of the connection pool.
   * @param subscribe_timeout_ms how long a subscription waits for a message.
   */
  RedisWrapper(absl::string_view redis_server_uri, unsigned int threads,
               int subscribe_timeout_ms);

  virtual ~RedisWrapper() = default;

  virtual bool set(absl::string_view key, absl::string_view val,
                   std::chrono::milliseconds ttl);

  virtual absl::optional<std::string> get(absl::string_view key);

  virtual long long del(absl::string_view key);

  /**
   * WATCH the key, read its value and remaining time to live, and, if update
   * asks for a write, replace the value in a MULTI/EXEC transaction keeping
   * the time to live.
   * @return false if another client modified the key before EXEC.
   */
  virtual bool update(absl::string_view key, const RedisValueUpdate &update);

  virtual void configSet(absl::string_view parameter, absl::string_view value);

  virtual std::unique_ptr<RedisSubscription> subscribe(
      absl::string_view channel);

  // The logical database selected by the server uri.
  virtual int db() const;
};

}  // namespace store
}  // namespace authbridge

#endif  // AUTHBRIDGE_SRC_STORE_REDIS_WRAPPER_H_
