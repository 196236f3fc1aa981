#ifndef LOCO_PLATFORM_NET_H
#define LOCO_PLATFORM_NET_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace loco::platform::net {

using Socket = int;
constexpr Socket kInvalidSocket = -1;

enum class IoStatus : std::uint8_t {
  kOk = 0,
  kClosed = 1,
  kTimeout = 2,
  kError = 3
};

bool EnsureInitialized();
bool SetRecvTimeout(Socket sock, std::uint32_t timeout_ms);
bool SetSendTimeout(Socket sock, std::uint32_t timeout_ms);
bool SetNoDelay(Socket sock);
bool SocketWouldBlock();
bool SocketWasReset();

IoStatus SendAll(Socket sock, const std::uint8_t* data, std::size_t len);
// Reads up to len bytes; out_read is 0 only when the status is not kOk.
IoStatus RecvSome(Socket sock, std::uint8_t* data, std::size_t len,
                  std::size_t& out_read);

// timeout_ms bounds the connect itself and is left on the socket as the
// send/receive timeout. Zero means no timeout. On failure status is kTimeout
// when the deadline passed and kError otherwise.
bool ConnectTcp(const std::string& host, std::uint16_t port,
                std::uint32_t timeout_ms, Socket& out, IoStatus& status,
                std::string& error);

bool ShutdownBoth(Socket sock);
void CloseSocket(Socket& sock);

}  // namespace loco::platform::net

#endif  // LOCO_PLATFORM_NET_H
