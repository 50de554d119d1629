#ifndef AUTHBRIDGE_SRC_STORE_IN_MEMORY_COORDINATION_STORE_H_
#define AUTHBRIDGE_SRC_STORE_IN_MEMORY_COORDINATION_STORE_H_

#include <condition_variable>
#include <mutex>
#include <unordered_map>

#include "src/common/utilities/time_service.h"
#include "src/store/coordination_store.h"

namespace authbridge {
namespace store {

/**
 * A CoordinationStore kept in the memory of a single process. Entries expire
 * by the clock of the given TimeService.
 */
class InMemoryCoordinationStore : public CoordinationStore {
 public:
  explicit InMemoryCoordinationStore(
      std::shared_ptr<common::utilities::TimeService> time_service);

  void PutWithTtl(absl::string_view key, absl::string_view value,
                  std::chrono::seconds ttl) override;

  absl::optional<std::string> Get(absl::string_view key) override;

  absl::Status Update(absl::string_view key, const Mutation &mutation) override;

  void Delete(absl::string_view key) override;

  std::unique_ptr<Watcher> Watch(absl::string_view key) override;

  void RemoveAllExpired() override;

  struct Entry {
    std::string value;
    int64_t expires_at_ms;
    uint64_t revision;
  };

  // Shared with the watchers so that they can wait for changes.
  struct State {
    std::unordered_map<std::string, Entry> entries;
    uint64_t revision = 0;
    std::recursive_mutex mutex;
    std::condition_variable_any changed;
    std::shared_ptr<common::utilities::TimeService> time_service;

    // Find an entry, dropping it first if it has expired. Must be called with
    // the mutex held.
    Entry *Find(const std::string &key);
  };

 private:
  std::shared_ptr<State> state_;
};

}  // namespace store
}  // namespace authbridge

#endif  // AUTHBRIDGE_SRC_STORE_IN_MEMORY_COORDINATION_STORE_H_
