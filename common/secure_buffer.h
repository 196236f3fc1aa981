#ifndef LOCO_COMMON_SECURE_BUFFER_H
#define LOCO_COMMON_SECURE_BUFFER_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <openssl/crypto.h>

namespace loco::common {

// Session keys, IVs and OAEP blocks are cleared with OPENSSL_cleanse so the
// store is not elided.
inline void SecureWipe(void* data, std::size_t len) {
  if (data && len > 0) {
    OPENSSL_cleanse(data, len);
  }
}

inline void SecureWipe(std::vector<std::uint8_t>& buf) {
  SecureWipe(buf.data(), buf.size());
}

template <std::size_t N>
inline void SecureWipe(std::array<std::uint8_t, N>& buf) {
  SecureWipe(buf.data(), N);
}

// Wipes the referenced buffer when the scope ends. A vector is wiped at its
// size at that point.
class ScopedWipe {
 public:
  explicit ScopedWipe(std::vector<std::uint8_t>& buf) : vec_(&buf) {}

  template <std::size_t N>
  explicit ScopedWipe(std::array<std::uint8_t, N>& buf)
      : data_(buf.data()), len_(N) {}

  ScopedWipe(const ScopedWipe&) = delete;
  ScopedWipe& operator=(const ScopedWipe&) = delete;

  ~ScopedWipe() {
    if (vec_) {
      SecureWipe(*vec_);
    } else {
      SecureWipe(data_, len_);
    }
  }

 private:
  std::vector<std::uint8_t>* vec_{nullptr};
  void* data_{nullptr};
  std::size_t len_{0};
};

}  // namespace loco::common

#endif  // LOCO_COMMON_SECURE_BUFFER_H
