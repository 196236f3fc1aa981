#include "platform_random.h"

#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

#if defined(__linux__)
#include <sys/random.h>
#endif

namespace loco::platform {

namespace {

#if defined(__linux__)
bool FillFromGetrandom(std::uint8_t* out, std::size_t len) {
  std::size_t filled = 0;
  while (filled < len) {
    const ssize_t n = ::getrandom(out + filled, len - filled, 0);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return false;
    }
    filled += static_cast<std::size_t>(n);
  }
  return true;
}
#endif

bool FillFromUrandom(std::uint8_t* out, std::size_t len) {
  const int fd = ::open("/dev/urandom", O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return false;
  }
  std::size_t filled = 0;
  bool ok = true;
  while (filled < len) {
    const ssize_t n = ::read(fd, out + filled, len - filled);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      ok = false;
      break;
    }
    filled += static_cast<std::size_t>(n);
  }
  ::close(fd);
  return ok;
}

}  // namespace

bool RandomBytes(std::uint8_t* out, std::size_t len) {
  if (!out || len == 0) {
    return false;
  }
#if defined(__linux__)
  if (FillFromGetrandom(out, len)) {
    return true;
  }
#endif
  return FillFromUrandom(out, len);
}

}  // namespace loco::platform
