#ifndef AUTHBRIDGE_SRC_STORE_COORDINATION_STORE_H_
#define AUTHBRIDGE_SRC_STORE_COORDINATION_STORE_H_

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"

namespace authbridge {
namespace store {

/**
 * Thrown by coordination store implementations when the backing service
 * cannot be reached or answers with an error.
 */
class StoreError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct WatchEvent {
  enum class Type { kPut, kDelete, kError };

  Type type;
  // Set for kPut.
  std::string value;
  // Set for kError.
  std::string error;

  static WatchEvent Put(std::string value) {
    return WatchEvent{Type::kPut, std::move(value), ""};
  }
  static WatchEvent Delete() { return WatchEvent{Type::kDelete, "", ""}; }
  static WatchEvent Error(std::string error) {
    return WatchEvent{Type::kError, "", std::move(error)};
  }
};

/**
 * A subscription to the changes of a single key. The first event reflects the
 * state of the key when the watch was opened. Destroying the watcher releases
 * the subscription.
 */
class Watcher {
 public:
  virtual ~Watcher() = default;

  /**
   * Block until the next event or until the timeout passes.
   * @param timeout the longest time to wait.
   * @return the event, or nullopt on timeout.
   */
  virtual absl::optional<WatchEvent> Next(std::chrono::milliseconds timeout) = 0;
};

/**
 * Computes the new value of a key from its current value inside an update.
 * Returning nullopt leaves the key untouched, a non-OK status aborts the
 * update.
 */
using Mutation = std::function<absl::StatusOr<absl::optional<std::string>>(
    const absl::optional<std::string> &current)>;

class CoordinationStore {
 public:
  virtual ~CoordinationStore() = default;

  virtual void PutWithTtl(absl::string_view key, absl::string_view value,
                          std::chrono::seconds ttl) = 0;

  virtual absl::optional<std::string> Get(absl::string_view key) = 0;

  /**
   * Serializable read-modify-write of a single key. The remaining time to
   * live of the key is kept. Keys are only created by PutWithTtl, so a write
   * to an absent key is rejected.
   * @return the mutation's error verbatim, NOT_FOUND when the mutation writes
   * to an absent key, UNAVAILABLE when concurrent writers kept conflicting,
   * OK otherwise.
   * @throws StoreError on transport errors.
   */
  virtual absl::Status Update(absl::string_view key,
                              const Mutation &mutation) = 0;

  virtual void Delete(absl::string_view key) = 0;

  virtual std::unique_ptr<Watcher> Watch(absl::string_view key) = 0;

  virtual void RemoveAllExpired() = 0;
};

typedef std::shared_ptr<CoordinationStore> CoordinationStorePtr;

}  // namespace store
}  // namespace authbridge

#endif  // AUTHBRIDGE_SRC_STORE_COORDINATION_STORE_H_
