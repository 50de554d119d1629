#include "src/login/session_store.h"

#include "absl/strings/str_cat.h"
#include "spdlog/spdlog.h"
#include "src/login/errors.h"

namespace authbridge {
namespace login {
namespace {

std::string KeyFor(absl::string_view token) {
  return absl::StrCat("authbridge/session/", token);
}

}  // namespace

SessionStore::SessionStore(store::CoordinationStorePtr store)
    : store_(store) {}

absl::Status SessionStore::CreatePending(absl::string_view token,
                                         absl::string_view nonce,
                                         std::chrono::seconds ttl) {
  SessionInfo record;
  record.set_nonce(std::string(nonce));
  try {
    store_->PutWithTtl(KeyFor(token), record.SerializeAsString(), ttl);
  } catch (const store::StoreError &err) {
    spdlog::error("{}: failed to create session {}: {}", __func__,
                  std::string(token), err.what());
    return StoreUnavailableError(err.what());
  }
  return absl::OkStatus();
}

std::unique_ptr<store::Watcher> SessionStore::Watch(absl::string_view token) {
  return store_->Watch(KeyFor(token));
}

absl::Status SessionStore::TransactionalUpdate(absl::string_view token,
                                               const SessionMutator &mutator) {
  try {
    return store_->Update(
        KeyFor(token),
        [&mutator](const absl::optional<std::string> &current)
            -> absl::StatusOr<absl::optional<std::string>> {
          if (!current.has_value()) {
            return absl::NotFoundError("no session record");
          }
          auto record = Decode(*current);
          if (!record.ok()) {
            return record.status();
          }
          auto status = mutator(&*record);
          if (!status.ok()) {
            return status;
          }
          auto updated = record->SerializeAsString();
          if (updated == *current) {
            return absl::optional<std::string>();
          }
          return absl::optional<std::string>(std::move(updated));
        });
  } catch (const store::StoreError &err) {
    return StoreUnavailableError(err.what());
  }
}

absl::Status SessionStore::Delete(absl::string_view token) {
  try {
    store_->Delete(KeyFor(token));
  } catch (const store::StoreError &err) {
    return StoreUnavailableError(err.what());
  }
  return absl::OkStatus();
}

void SessionStore::RemoveAllExpired() {
  try {
    store_->RemoveAllExpired();
  } catch (const store::StoreError &e) {
    spdlog::warn("{}: expired sessions not removed: {}", __func__, e.what());
  }
}

absl::StatusOr<SessionInfo> SessionStore::Decode(absl::string_view value) {
  SessionInfo record;
  if (!record.ParseFromArray(value.data(), static_cast<int>(value.size()))) {
    return absl::DataLossError("malformed session record");
  }
  return record;
}

}  // namespace login
}  // namespace authbridge
