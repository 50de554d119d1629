#ifndef AUTHBRIDGE_SRC_COMMON_UTILITIES_BACKOFF_H_
#define AUTHBRIDGE_SRC_COMMON_UTILITIES_BACKOFF_H_

#include <chrono>
#include <functional>

#include "absl/random/random.h"
#include "absl/status/status.h"
#include "absl/types/optional.h"

namespace authbridge {
namespace common {
namespace utilities {

struct BackOffPolicy {
  std::chrono::milliseconds initial_interval{500};
  std::chrono::milliseconds max_interval{10000};
  // Upper bound on the cumulative time spent sleeping between attempts.
  std::chrono::milliseconds max_elapsed{60000};
  double multiplier = 1.5;
  double randomization_factor = 0.5;
};

/**
 * ExponentialBackOff hands out growing, randomized delays until the sum of
 * the delays handed out would exceed the policy's max_elapsed.
 */
class ExponentialBackOff {
 public:
  explicit ExponentialBackOff(const BackOffPolicy &policy);

  /**
   * @return the delay before the next attempt, or nullopt when the budget is
   * exhausted.
   */
  absl::optional<std::chrono::milliseconds> NextBackOff();

  void Reset();

  std::chrono::milliseconds Elapsed() const { return elapsed_; }

 private:
  BackOffPolicy policy_;
  double current_interval_ms_;
  std::chrono::milliseconds elapsed_;
  absl::BitGen bitgen_;
};

/**
 * The outcome of a single attempt inside RetryWithBackOff. A transient
 * failure is retried after a delay, a terminal one is returned as is.
 */
class AttemptResult {
 public:
  enum class Kind { kDone, kRetry, kStop };

  static AttemptResult Done() { return AttemptResult(Kind::kDone, absl::OkStatus()); }
  static AttemptResult Retry(absl::Status status) {
    return AttemptResult(Kind::kRetry, std::move(status));
  }
  static AttemptResult Stop(absl::Status status) {
    return AttemptResult(Kind::kStop, std::move(status));
  }

  Kind kind() const { return kind_; }
  const absl::Status &status() const { return status_; }

 private:
  AttemptResult(Kind kind, absl::Status status)
      : kind_(kind), status_(std::move(status)) {}

  Kind kind_;
  absl::Status status_;
};

using RetryNotifier =
    std::function<void(const absl::Status &, std::chrono::milliseconds)>;
using Sleeper = std::function<void(std::chrono::milliseconds)>;

/**
 * Run attempt until it reports Done or Stop, sleeping between Retry results
 * as directed by backoff. When the backoff budget runs out, the status of the
 * last transient failure is returned.
 * @param attempt the operation to run.
 * @param backoff the delay policy, reset before the first attempt.
 * @param notify invoked with the transient failure and the upcoming delay.
 * @param sleep performs the delay.
 * @return OK after Done, otherwise the terminal or last transient status.
 */
absl::Status RetryWithBackOff(const std::function<AttemptResult()> &attempt,
                              ExponentialBackOff &backoff,
                              const RetryNotifier &notify,
                              const Sleeper &sleep);

}  // namespace utilities
}  // namespace common
}  // namespace authbridge

#endif  // AUTHBRIDGE_SRC_COMMON_UTILITIES_BACKOFF_H_
