#pragma once

#include <chrono>

namespace cronlet {

using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock>;

} // namespace cronlet
