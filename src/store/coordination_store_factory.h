#ifndef AUTHBRIDGE_SRC_STORE_COORDINATION_STORE_FACTORY_H_
#define AUTHBRIDGE_SRC_STORE_COORDINATION_STORE_FACTORY_H_

#include "config/config.pb.h"
#include "src/common/utilities/time_service.h"
#include "src/store/coordination_store.h"

namespace authbridge {
namespace store {

class CoordinationStoreFactory {
 public:
  virtual ~CoordinationStoreFactory() = default;

  virtual CoordinationStorePtr create() = 0;
};

class InMemoryCoordinationStoreFactory : public CoordinationStoreFactory {
 public:
  explicit InMemoryCoordinationStoreFactory(
      std::shared_ptr<common::utilities::TimeService> time_service)
      : time_service_(time_service) {}

  CoordinationStorePtr create() override;

 private:
  std::shared_ptr<common::utilities::TimeService> time_service_;
};

class RedisCoordinationStoreFactory : public CoordinationStoreFactory {
 public:
  RedisCoordinationStoreFactory(const config::RedisStoreConfig &config,
                                int threads, int subscribe_timeout_ms)
      : threads_(threads),
        subscribe_timeout_ms_(subscribe_timeout_ms),
        config_(config) {}

  CoordinationStorePtr create() override;

 private:
  const int threads_ = 1;
  const int subscribe_timeout_ms_ = 1000;
  const config::RedisStoreConfig config_;
};

/**
 * Select the store named by the configuration; the in-memory store when none
 * is named.
 */
std::unique_ptr<CoordinationStoreFactory> GetCoordinationStoreFactory(
    const config::Config &config);

}  // namespace store
}  // namespace authbridge

#endif  // AUTHBRIDGE_SRC_STORE_COORDINATION_STORE_FACTORY_H_
