#include "src/store/coordination_store_factory.h"

#include "spdlog/spdlog.h"
#include "src/config/get_config.h"
#include "src/store/in_memory_coordination_store.h"
#include "src/store/redis_coordination_store.h"

namespace authbridge {
namespace store {

CoordinationStorePtr InMemoryCoordinationStoreFactory::create() {
  return std::make_shared<InMemoryCoordinationStore>(time_service_);
}

CoordinationStorePtr RedisCoordinationStoreFactory::create() {
  auto redis_wrapper = std::make_shared<RedisWrapper>(
      config_.server_uri(), threads_, subscribe_timeout_ms_);
  return std::make_shared<RedisCoordinationStore>(
      std::make_shared<RedisRetryWrapper>(redis_wrapper),
      config_.enable_keyspace_notifications());
}

std::unique_ptr<CoordinationStoreFactory> GetCoordinationStoreFactory(
    const config::Config &config) {
  if (config.session_store().has_redis()) {
    spdlog::trace("{}: using Redis coordination store", __func__);
    return std::make_unique<RedisCoordinationStoreFactory>(
        config.session_store().redis(), config::GetThreads(config),
        config::GetWatchPollInterval(config));
  }
  spdlog::trace("{}: using in-memory coordination store", __func__);
  return std::make_unique<InMemoryCoordinationStoreFactory>(
      std::make_shared<common::utilities::TimeService>());
}

}  // namespace store
}  // namespace authbridge
