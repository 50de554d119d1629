#include "src/store/redis_coordination_store.h"

#include "absl/strings/str_cat.h"
#include "spdlog/spdlog.h"

namespace authbridge {
namespace store {
namespace {

// Conflicting transactions are retried this many times.
const int kMaxUpdateRetries = 3;

const char *kKeyspaceEvents = "K$gx";

class RedisWatcher : public Watcher {
 public:
  RedisWatcher(std::shared_ptr<RedisRetryWrapper> redis_wrapper,
               std::string key)
      : redis_wrapper_(std::move(redis_wrapper)), key_(std::move(key)) {}

  absl::optional<WatchEvent> Next(std::chrono::milliseconds timeout) override {
    if (subscription_ == nullptr) {
      try {
        // Subscribe before the first read so that no change slips between.
        subscription_ = redis_wrapper_->subscribe(
            absl::StrCat("__keyspace@", redis_wrapper_->db(), "__:", key_));
      } catch (const StoreError &err) {
        return WatchEvent::Error(err.what());
      }
    }
    if (!delivered_) {
      return Reread();
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
      absl::optional<std::string> message;
      try {
        message = subscription_->consume();
      } catch (const StoreError &err) {
        subscription_.reset();
        return WatchEvent::Error(err.what());
      }

      if (message.has_value()) {
        spdlog::trace("{}: keyspace event {}", __func__, *message);
        absl::optional<WatchEvent> event;
        if (*message == "del" || *message == "expired") {
          event = Deliver(absl::nullopt);
        } else if (*message == "set") {
          event = Reread();
        }
        if (event.has_value()) {
          return event;
        }
      }

      if (std::chrono::steady_clock::now() >= deadline) {
        return Reread();
      }
    }
  }

 private:
  // Read the key and report it if it differs from what was last delivered.
  absl::optional<WatchEvent> Reread() {
    absl::optional<std::string> value;
    try {
      value = redis_wrapper_->get(key_);
    } catch (const StoreError &err) {
      return WatchEvent::Error(err.what());
    }
    return Deliver(value);
  }

  absl::optional<WatchEvent> Deliver(const absl::optional<std::string> &value) {
    if (delivered_ && value == last_value_) {
      return absl::nullopt;
    }
    delivered_ = true;
    last_value_ = value;
    if (!value.has_value()) {
      return WatchEvent::Delete();
    }
    return WatchEvent::Put(*value);
  }

  std::shared_ptr<RedisRetryWrapper> redis_wrapper_;
  std::string key_;
  std::unique_ptr<RedisSubscription> subscription_;
  bool delivered_ = false;
  absl::optional<std::string> last_value_;
};

}  // namespace

RedisCoordinationStore::RedisCoordinationStore(
    std::shared_ptr<RedisRetryWrapper> redis_wrapper,
    bool enable_keyspace_notifications)
    : redis_wrapper_(redis_wrapper) {
  if (enable_keyspace_notifications) {
    spdlog::info("{}: enabling keyspace notifications {}", __func__,
                 kKeyspaceEvents);
    redis_wrapper_->configSet("notify-keyspace-events", kKeyspaceEvents);
  }
}

void RedisCoordinationStore::PutWithTtl(absl::string_view key,
                                        absl::string_view value,
                                        std::chrono::seconds ttl) {
  redis_wrapper_->set(key, value,
                      std::chrono::duration_cast<std::chrono::milliseconds>(ttl));
}

absl::optional<std::string> RedisCoordinationStore::Get(absl::string_view key) {
  return redis_wrapper_->get(key);
}

absl::Status RedisCoordinationStore::Update(absl::string_view key,
                                            const Mutation &mutation) {
  for (int retries = 0; retries <= kMaxUpdateRetries; retries++) {
    absl::Status mutation_status;
    auto committed = redis_wrapper_->update(
        key,
        [&mutation, &mutation_status](const absl::optional<std::string> &current)
            -> absl::optional<std::string> {
          auto updated = mutation(current);
          if (!updated.ok()) {
            mutation_status = updated.status();
            return absl::nullopt;
          }
          if (!current.has_value() && updated->has_value()) {
            mutation_status = absl::NotFoundError("cannot update absent key");
            return absl::nullopt;
          }
          return *updated;
        });
    if (!mutation_status.ok()) {
      return mutation_status;
    }
    if (committed) {
      return absl::OkStatus();
    }
    spdlog::debug("{}: concurrent modification, retrying", __func__);
  }
  return absl::UnavailableError(
      "update kept conflicting with concurrent writers");
}

void RedisCoordinationStore::Delete(absl::string_view key) {
  redis_wrapper_->del(key);
}

std::unique_ptr<Watcher> RedisCoordinationStore::Watch(absl::string_view key) {
  return std::unique_ptr<Watcher>(
      new RedisWatcher(redis_wrapper_, std::string(key)));
}

}  // namespace store
}  // namespace authbridge
