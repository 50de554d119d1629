#ifndef AUTHBRIDGE_SRC_STORE_REDIS_RETRY_WRAPPER_H_
#define AUTHBRIDGE_SRC_STORE_REDIS_RETRY_WRAPPER_H_

#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include "src/store/redis_wrapper.h"

namespace authbridge {
namespace store {

/**
 * Retries RedisWrapper calls that failed because of a closed connection or an
 * I/O error, up to three more times.
 */
class RedisRetryWrapper {
 private:
  std::shared_ptr<RedisWrapper> redis_wrapper_;

 public:
  explicit RedisRetryWrapper(std::shared_ptr<RedisWrapper> redis_wrapper);

  virtual ~RedisRetryWrapper() = default;

  virtual bool set(absl::string_view key, absl::string_view val,
                   std::chrono::milliseconds ttl);

  virtual absl::optional<std::string> get(absl::string_view key);

  virtual long long del(absl::string_view key);

  virtual bool update(absl::string_view key, const RedisValueUpdate &update);

  virtual void configSet(absl::string_view parameter, absl::string_view value);

  virtual std::unique_ptr<RedisSubscription> subscribe(
      absl::string_view channel);

  virtual int db() const;
};

}  // namespace store
}  // namespace authbridge

#endif  // AUTHBRIDGE_SRC_STORE_REDIS_RETRY_WRAPPER_H_
