#include "src/common/utilities/backoff.h"

#include <algorithm>

namespace authbridge {
namespace common {
namespace utilities {

ExponentialBackOff::ExponentialBackOff(const BackOffPolicy &policy)
    : policy_(policy),
      current_interval_ms_(static_cast<double>(policy.initial_interval.count())),
      elapsed_(0) {}

void ExponentialBackOff::Reset() {
  current_interval_ms_ = static_cast<double>(policy_.initial_interval.count());
  elapsed_ = std::chrono::milliseconds(0);
}

absl::optional<std::chrono::milliseconds> ExponentialBackOff::NextBackOff() {
  double delta = policy_.randomization_factor * current_interval_ms_;
  double delay_ms = current_interval_ms_;
  if (delta > 0) {
    delay_ms = absl::Uniform<double>(bitgen_, current_interval_ms_ - delta,
                                     current_interval_ms_ + delta);
  }
  auto delay = std::chrono::milliseconds(
      std::max<int64_t>(0, static_cast<int64_t>(delay_ms)));

  if (elapsed_ + delay > policy_.max_elapsed) {
    return absl::nullopt;
  }
  elapsed_ += delay;

  current_interval_ms_ =
      std::min(current_interval_ms_ * policy_.multiplier,
               static_cast<double>(policy_.max_interval.count()));
  return delay;
}

absl::Status RetryWithBackOff(const std::function<AttemptResult()> &attempt,
                              ExponentialBackOff &backoff,
                              const RetryNotifier &notify,
                              const Sleeper &sleep) {
  backoff.Reset();
  while (true) {
    auto result = attempt();
    switch (result.kind()) {
      case AttemptResult::Kind::kDone:
        return absl::OkStatus();
      case AttemptResult::Kind::kStop:
        return result.status();
      case AttemptResult::Kind::kRetry:
        break;
    }

    auto delay = backoff.NextBackOff();
    if (!delay.has_value()) {
      return result.status();
    }
    if (notify) {
      notify(result.status(), *delay);
    }
    sleep(*delay);
  }
}

}  // namespace utilities
}  // namespace common
}  // namespace authbridge
