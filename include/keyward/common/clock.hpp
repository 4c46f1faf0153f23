#pragma once

#include <keyward/schema/primitives.hpp>
#include <functional>

namespace keyward::common {

/// Source of "now" injected into every evaluation.
using clock_source_t = std::function<keyward::schema::timestamp_milliseconds_t()>;

/// Wall clock in milliseconds since the Unix epoch.
clock_source_t system_clock_source();

}  // namespace keyward::common
