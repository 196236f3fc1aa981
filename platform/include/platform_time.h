#ifndef LOCO_PLATFORM_TIME_H
#define LOCO_PLATFORM_TIME_H

#include <cstdint>

namespace loco::platform {

std::uint64_t NowSteadyMs();
void SleepMs(std::uint32_t ms);

}  // namespace loco::platform

#endif  // LOCO_PLATFORM_TIME_H
