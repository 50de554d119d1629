#ifndef AUTHBRIDGE_SRC_STORE_REDIS_COORDINATION_STORE_H_
#define AUTHBRIDGE_SRC_STORE_REDIS_COORDINATION_STORE_H_

#include "src/store/coordination_store.h"
#include "src/store/redis_retry_wrapper.h"

namespace authbridge {
namespace store {

/**
 * A CoordinationStore backed by a Redis server. Watches are built on keyspace
 * notifications and fall back to re-reading the key when no notification
 * arrives in time.
 */
class RedisCoordinationStore : public CoordinationStore {
 private:
  std::shared_ptr<RedisRetryWrapper> redis_wrapper_;

 public:
  /**
   * @param redis_wrapper the Redis client.
   * @param enable_keyspace_notifications configure the server to publish the
   * keyspace events the watches listen to.
   */
  RedisCoordinationStore(std::shared_ptr<RedisRetryWrapper> redis_wrapper,
                         bool enable_keyspace_notifications);

  void PutWithTtl(absl::string_view key, absl::string_view value,
                  std::chrono::seconds ttl) override;

  absl::optional<std::string> Get(absl::string_view key) override;

  absl::Status Update(absl::string_view key, const Mutation &mutation) override;

  void Delete(absl::string_view key) override;

  std::unique_ptr<Watcher> Watch(absl::string_view key) override;

  // Redis expires keys on its own.
  void RemoveAllExpired() override {}
};

}  // namespace store
}  // namespace authbridge

#endif  // AUTHBRIDGE_SRC_STORE_REDIS_COORDINATION_STORE_H_
