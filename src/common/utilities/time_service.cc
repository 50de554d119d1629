#include <chrono>
#include "time_service.h"

namespace authbridge {
namespace common {
namespace utilities {

int64_t TimeService::GetCurrentTimeInSecondsSinceEpoch() {
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()
  );
  return seconds.count();
}

int64_t TimeService::GetCurrentTimeInMillisecondsSinceEpoch() {
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()
  );
  return millis.count();
}

}  // namespace utilities
}  // namespace common
}  // namespace authbridge
