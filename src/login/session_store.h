#ifndef AUTHBRIDGE_SRC_LOGIN_SESSION_STORE_H_
#define AUTHBRIDGE_SRC_LOGIN_SESSION_STORE_H_

#include <chrono>
#include <functional>
#include <memory>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "api/session/v1/session_info.pb.h"
#include "src/store/coordination_store.h"

namespace authbridge {
namespace login {

using api::session::v1::SessionInfo;

/**
 * Changes a session record in place. A non-OK status aborts the update
 * without writing; an unchanged record is not written.
 */
using SessionMutator = std::function<absl::Status(SessionInfo *record)>;

/**
 * Keeps login session records, keyed by their state token, in a coordination
 * store.
 */
class SessionStore {
 private:
  store::CoordinationStorePtr store_;

 public:
  explicit SessionStore(store::CoordinationStorePtr store);

  virtual ~SessionStore() = default;

  /**
   * Insert a pending record.
   * @return UNAVAILABLE when the store could not take the record.
   */
  virtual absl::Status CreatePending(absl::string_view token,
                                     absl::string_view nonce,
                                     std::chrono::seconds ttl);

  /**
   * Watch the record of the given token. Transport failures are reported as
   * kError events.
   */
  virtual std::unique_ptr<store::Watcher> Watch(absl::string_view token);

  /**
   * Read, mutate and write back a record in one transaction.
   * @return the mutator's error verbatim, NOT_FOUND when there is no record,
   * UNAVAILABLE when the store failed.
   */
  virtual absl::Status TransactionalUpdate(absl::string_view token,
                                           const SessionMutator &mutator);

  virtual absl::Status Delete(absl::string_view token);

  virtual void RemoveAllExpired();

  static absl::StatusOr<SessionInfo> Decode(absl::string_view value);
};

typedef std::shared_ptr<SessionStore> SessionStorePtr;

}  // namespace login
}  // namespace authbridge

#endif  // AUTHBRIDGE_SRC_LOGIN_SESSION_STORE_H_
