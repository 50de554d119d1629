#ifndef AUTHBRIDGE_SYNCHRONIZED_H
#define AUTHBRIDGE_SYNCHRONIZED_H

#include <mutex>
#define synchronized(m) \
  for (std::unique_lock<std::recursive_mutex> lk(m); lk; lk.unlock())

#endif  // AUTHBRIDGE_SYNCHRONIZED_H
