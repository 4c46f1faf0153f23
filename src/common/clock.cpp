#include <keyward/common/clock.hpp>

#include <chrono>

namespace keyward::common {

clock_source_t system_clock_source() {
  return [] {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<keyward::schema::timestamp_milliseconds_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
  };
}

}  // namespace keyward::common
