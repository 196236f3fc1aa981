#ifndef LOCO_PLATFORM_RANDOM_H
#define LOCO_PLATFORM_RANDOM_H

#include <cstddef>
#include <cstdint>

namespace loco::platform {

// Fills `out` from the kernel CSPRNG. Returns false if fewer than `len`
// bytes could be read; callers fall back to RAND_bytes.
bool RandomBytes(std::uint8_t* out, std::size_t len);

}  // namespace loco::platform

#endif  // LOCO_PLATFORM_RANDOM_H
