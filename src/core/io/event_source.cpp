// File: src/core/io/event_source.cpp
#include "sx/core/io/event_source.hpp"

#include <chrono>

namespace sx {

Seconds wall_now_s() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now().time_since_epoch();
  return std::chrono::duration<double>(now).count();
}

}  // namespace sx
