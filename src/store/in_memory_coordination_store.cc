#include "src/store/in_memory_coordination_store.h"

#include <algorithm>

#include "absl/strings/str_cat.h"
#include "spdlog/spdlog.h"
#include "src/common/utilities/synchronized.h"

namespace authbridge {
namespace store {
namespace {

class InMemoryWatcher : public Watcher {
 public:
  InMemoryWatcher(std::shared_ptr<InMemoryCoordinationStore::State> state,
                  std::string key)
      : state_(std::move(state)), key_(std::move(key)) {}

  absl::optional<WatchEvent> Next(std::chrono::milliseconds timeout) override {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::recursive_mutex> lock(state_->mutex);
    while (true) {
      auto entry = state_->Find(key_);
      uint64_t revision = entry == nullptr ? 0 : entry->revision;
      if (!delivered_ || revision != delivered_revision_) {
        delivered_ = true;
        delivered_revision_ = revision;
        if (entry == nullptr) {
          return WatchEvent::Delete();
        }
        return WatchEvent::Put(entry->value);
      }

      auto now = std::chrono::steady_clock::now();
      if (now >= deadline) {
        return absl::nullopt;
      }
      auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - now);
      if (entry != nullptr) {
        auto until_expiry =
            entry->expires_at_ms -
            state_->time_service->GetCurrentTimeInMillisecondsSinceEpoch();
        wait = std::min(wait, std::chrono::milliseconds(
                                  std::max<int64_t>(until_expiry, 0)));
      }
      state_->changed.wait_for(lock, wait);
    }
  }

 private:
  std::shared_ptr<InMemoryCoordinationStore::State> state_;
  std::string key_;
  bool delivered_ = false;
  uint64_t delivered_revision_ = 0;
};

}  // namespace

InMemoryCoordinationStore::Entry *InMemoryCoordinationStore::State::Find(
    const std::string &key) {
  auto search = entries.find(key);
  if (search == entries.end()) {
    return nullptr;
  }
  if (search->second.expires_at_ms <=
      time_service->GetCurrentTimeInMillisecondsSinceEpoch()) {
    spdlog::debug("{}: entry expired", __func__);
    entries.erase(search);
    revision++;
    changed.notify_all();
    return nullptr;
  }
  return &search->second;
}

InMemoryCoordinationStore::InMemoryCoordinationStore(
    std::shared_ptr<common::utilities::TimeService> time_service)
    : state_(std::make_shared<State>()) {
  state_->time_service = std::move(time_service);
}

void InMemoryCoordinationStore::PutWithTtl(absl::string_view key,
                                           absl::string_view value,
                                           std::chrono::seconds ttl) {
  synchronized(state_->mutex) {
    auto now = state_->time_service->GetCurrentTimeInMillisecondsSinceEpoch();
    auto expires_at =
        now + std::chrono::duration_cast<std::chrono::milliseconds>(ttl).count();
    state_->entries[std::string(key)] =
        Entry{std::string(value), expires_at, ++state_->revision};
    state_->changed.notify_all();
  }
}

absl::optional<std::string> InMemoryCoordinationStore::Get(
    absl::string_view key) {
  synchronized(state_->mutex) {
    auto entry = state_->Find(std::string(key));
    if (entry == nullptr) {
      return absl::nullopt;
    }
    return entry->value;
  }
  return absl::nullopt;
}

absl::Status InMemoryCoordinationStore::Update(absl::string_view key,
                                               const Mutation &mutation) {
  synchronized(state_->mutex) {
    std::string key_string(key);
    auto entry = state_->Find(key_string);
    absl::optional<std::string> current;
    if (entry != nullptr) {
      current = entry->value;
    }

    auto updated = mutation(current);
    if (!updated.ok()) {
      return updated.status();
    }
    if (!updated->has_value()) {
      return absl::OkStatus();
    }
    if (entry == nullptr) {
      return absl::NotFoundError(
          absl::StrCat("cannot update absent key ", key_string));
    }

    state_->entries[key_string] =
        Entry{**updated, entry->expires_at_ms, ++state_->revision};
    state_->changed.notify_all();
  }
  return absl::OkStatus();
}

void InMemoryCoordinationStore::Delete(absl::string_view key) {
  synchronized(state_->mutex) {
    if (state_->entries.erase(std::string(key)) > 0) {
      state_->revision++;
      state_->changed.notify_all();
    }
  }
}

std::unique_ptr<Watcher> InMemoryCoordinationStore::Watch(
    absl::string_view key) {
  return std::unique_ptr<Watcher>(
      new InMemoryWatcher(state_, std::string(key)));
}

void InMemoryCoordinationStore::RemoveAllExpired() {
  synchronized(state_->mutex) {
    auto now = state_->time_service->GetCurrentTimeInMillisecondsSinceEpoch();
    bool removed = false;
    auto itr = state_->entries.begin();
    while (itr != state_->entries.end()) {
      if (itr->second.expires_at_ms <= now) {
        itr = state_->entries.erase(itr);
        removed = true;
      } else {
        itr++;
      }
    }
    if (removed) {
      state_->revision++;
      state_->changed.notify_all();
    }
  }
}

}  // namespace store
}  // namespace authbridge
