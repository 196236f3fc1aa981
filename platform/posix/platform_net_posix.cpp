#include "platform_net.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <limits>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace loco::platform::net {

namespace {

IoStatus StatusFromErrno() {
  if (SocketWouldBlock()) {
    return IoStatus::kTimeout;
  }
  if (SocketWasReset()) {
    return IoStatus::kClosed;
  }
  return IoStatus::kError;
}

bool SetBlocking(Socket sock, bool blocking) {
  const int flags = fcntl(sock, F_GETFL, 0);
  if (flags < 0) {
    return false;
  }
  const int next = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
  return fcntl(sock, F_SETFL, next) == 0;
}

IoStatus ConnectWithTimeout(Socket sock, const sockaddr* addr,
                            socklen_t addr_len, std::uint32_t timeout_ms) {
  if (timeout_ms == 0) {
    if (::connect(sock, addr, addr_len) == 0) {
      return IoStatus::kOk;
    }
    return errno == ETIMEDOUT ? IoStatus::kTimeout : IoStatus::kError;
  }
  if (!SetBlocking(sock, false)) {
    return IoStatus::kError;
  }
  int rc = ::connect(sock, addr, addr_len);
  if (rc != 0 && errno != EINPROGRESS) {
    return errno == ETIMEDOUT ? IoStatus::kTimeout : IoStatus::kError;
  }
  if (rc != 0) {
    pollfd pfd{};
    pfd.fd = sock;
    pfd.events = POLLOUT;
    do {
      rc = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
    } while (rc < 0 && errno == EINTR);
    if (rc == 0) {
      return IoStatus::kTimeout;
    }
    if (rc < 0) {
      return IoStatus::kError;
    }
    int so_error = 0;
    socklen_t len = static_cast<socklen_t>(sizeof(so_error));
    if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0) {
      return IoStatus::kError;
    }
    if (so_error != 0) {
      return so_error == ETIMEDOUT ? IoStatus::kTimeout : IoStatus::kError;
    }
  }
  return SetBlocking(sock, true) ? IoStatus::kOk : IoStatus::kError;
}

}  // namespace

bool EnsureInitialized() {
  static const bool ok = std::signal(SIGPIPE, SIG_IGN) != SIG_ERR;
  return ok;
}

bool SetRecvTimeout(Socket sock, std::uint32_t timeout_ms) {
  timeval tv{};
  tv.tv_sec = static_cast<long>(timeout_ms / 1000u);
  tv.tv_usec = static_cast<long>((timeout_ms % 1000u) * 1000u);
  return setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv,
                    static_cast<socklen_t>(sizeof(tv))) == 0;
}

bool SetSendTimeout(Socket sock, std::uint32_t timeout_ms) {
  timeval tv{};
  tv.tv_sec = static_cast<long>(timeout_ms / 1000u);
  tv.tv_usec = static_cast<long>((timeout_ms % 1000u) * 1000u);
  return setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv,
                    static_cast<socklen_t>(sizeof(tv))) == 0;
}

bool SetNoDelay(Socket sock) {
  int yes = 1;
  return setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &yes,
                    static_cast<socklen_t>(sizeof(yes))) == 0;
}

bool SocketWouldBlock() {
  return errno == EAGAIN || errno == EWOULDBLOCK;
}

bool SocketWasReset() {
  return errno == ECONNRESET || errno == EPIPE || errno == ENOTCONN;
}

IoStatus SendAll(Socket sock, const std::uint8_t* data, std::size_t len) {
  if (!data || len == 0) {
    return IoStatus::kOk;
  }
  std::size_t sent = 0;
  while (sent < len) {
    const std::size_t remaining = len - sent;
    const std::size_t chunk =
        std::min<std::size_t>(remaining,
                              static_cast<std::size_t>((std::numeric_limits<int>::max)()));
    const ssize_t n = ::send(sock, data + sent, chunk, MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return n == 0 ? IoStatus::kClosed : StatusFromErrno();
    }
    sent += static_cast<std::size_t>(n);
  }
  return IoStatus::kOk;
}

IoStatus RecvSome(Socket sock, std::uint8_t* data, std::size_t len,
                  std::size_t& out_read) {
  out_read = 0;
  if (!data || len == 0) {
    return IoStatus::kOk;
  }
  const std::size_t chunk =
      std::min<std::size_t>(len,
                            static_cast<std::size_t>((std::numeric_limits<int>::max)()));
  while (true) {
    const ssize_t n = ::recv(sock, data, chunk, 0);
    if (n > 0) {
      out_read = static_cast<std::size_t>(n);
      return IoStatus::kOk;
    }
    if (n == 0) {
      return IoStatus::kClosed;
    }
    if (errno == EINTR) {
      continue;
    }
    return StatusFromErrno();
  }
}

bool ConnectTcp(const std::string& host, std::uint16_t port,
                std::uint32_t timeout_ms, Socket& out, IoStatus& status,
                std::string& error) {
  out = kInvalidSocket;
  status = IoStatus::kError;
  error.clear();
  if (host.empty() || port == 0) {
    error = "invalid endpoint";
    return false;
  }

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;

  addrinfo* result = nullptr;
  const std::string port_str = std::to_string(port);
  if (getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result) != 0) {
    error = "dns resolve failed";
    return false;
  }

  bool timed_out = false;
  for (addrinfo* rp = result; rp != nullptr; rp = rp->ai_next) {
    Socket sock = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
    if (sock < 0) {
      continue;
    }
    const IoStatus st =
        ConnectWithTimeout(sock, rp->ai_addr, rp->ai_addrlen, timeout_ms);
    if (st == IoStatus::kOk) {
      out = sock;
      break;
    }
    timed_out = timed_out || st == IoStatus::kTimeout;
    ::close(sock);
  }
  freeaddrinfo(result);

  if (out < 0) {
    status = timed_out ? IoStatus::kTimeout : IoStatus::kError;
    error = timed_out ? "connect timed out" : "connect failed";
    return false;
  }
  if (timeout_ms != 0 &&
      (!SetRecvTimeout(out, timeout_ms) || !SetSendTimeout(out, timeout_ms))) {
    CloseSocket(out);
    status = IoStatus::kError;
    error = "socket timeout setup failed";
    return false;
  }
  if (!SetNoDelay(out)) {
    CloseSocket(out);
    status = IoStatus::kError;
    error = "socket nodelay setup failed";
    return false;
  }
  status = IoStatus::kOk;
  return true;
}

bool ShutdownBoth(Socket sock) {
  if (sock < 0) {
    return false;
  }
  return shutdown(sock, SHUT_RDWR) == 0;
}

void CloseSocket(Socket& sock) {
  if (sock >= 0) {
    ::close(sock);
    sock = kInvalidSocket;
  }
}

}  // namespace loco::platform::net
