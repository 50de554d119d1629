#ifndef AUTHBRIDGE_TIME_SERVICE_H
#define AUTHBRIDGE_TIME_SERVICE_H

#include <cstdint>

namespace authbridge {
namespace common {
namespace utilities {

class TimeService {
 public:
  virtual ~TimeService() = default;

  virtual int64_t GetCurrentTimeInSecondsSinceEpoch();

  virtual int64_t GetCurrentTimeInMillisecondsSinceEpoch();
};

}  // namespace utilities
}  // namespace common
}  // namespace authbridge

#endif  // AUTHBRIDGE_TIME_SERVICE_H
