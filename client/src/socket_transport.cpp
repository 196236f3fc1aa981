#include "socket_transport.h"

#include <atomic>
#include <mutex>
#include <utility>

#include "platform_log.h"

namespace loco::client {

namespace pnet = platform::net;
namespace ptls = platform::tls;
namespace plog = platform::log;

namespace {

class SocketStream final : public ByteStream {
 public:
  SocketStream(pnet::Socket sock, ptls::ClientContext tls, bool use_tls)
      : sock_(sock), tls_(tls), use_tls_(use_tls) {}

  ~SocketStream() override { Close(); }

  SocketStream(const SocketStream&) = delete;
  SocketStream& operator=(const SocketStream&) = delete;

  IoStatus ReadSome(std::uint8_t* data, std::size_t len,
                    std::size_t& out_read) override {
    out_read = 0;
    if (shutdown_.load()) {
      return IoStatus::kClosed;
    }
    if (use_tls_) {
      return ptls::Read(tls_, data, len, out_read);
    }
    return pnet::RecvSome(sock_, data, len, out_read);
  }

  IoStatus WriteAll(const std::uint8_t* data, std::size_t len) override {
    if (shutdown_.load()) {
      return IoStatus::kClosed;
    }
    if (use_tls_) {
      return ptls::Write(tls_, data, len);
    }
    return pnet::SendAll(sock_, data, len);
  }

  bool SetReadTimeout(std::uint32_t timeout_ms) override {
    return pnet::SetRecvTimeout(sock_, timeout_ms);
  }

  void Shutdown() override {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (!shutdown_.exchange(true) && !pnet::ShutdownBoth(sock_)) {
      plog::Log(plog::Level::kDebug, "transport", "socket shutdown failed");
    }
  }

  void Close() override {
    std::lock_guard<std::mutex> lock(close_mutex_);
    shutdown_.store(true);
    if (use_tls_) {
      ptls::Close(tls_);
    }
    pnet::CloseSocket(sock_);
  }

 private:
  pnet::Socket sock_{pnet::kInvalidSocket};
  ptls::ClientContext tls_;
  bool use_tls_{false};
  std::atomic<bool> shutdown_{false};
  std::mutex close_mutex_;
};

}  // namespace

platform::tls::ClientVerifyConfig VerifyConfigFor(const BookingConfig& booking) {
  platform::tls::ClientVerifyConfig verify;
  verify.verify_peer = booking.verify_peer;
  verify.verify_hostname = booking.verify_peer && booking.verify_hostname;
  verify.ca_bundle_path = booking.ca_bundle;
  return verify;
}

bool SocketTransport::Connect(const Endpoint& endpoint, Security security,
                              std::uint32_t timeout_ms,
                              std::unique_ptr<ByteStream>& out,
                              IoStatus& status, std::string& error) {
  out.reset();
  status = IoStatus::kError;
  error.clear();
  if (!pnet::EnsureInitialized()) {
    error = "socket init failed";
    return false;
  }
  pnet::Socket sock = pnet::kInvalidSocket;
  if (!pnet::ConnectTcp(endpoint.host, endpoint.port, timeout_ms, sock, status,
                        error)) {
    return false;
  }
  ptls::ClientContext tls;
  const bool use_tls = security == Security::kTls;
  if (use_tls) {
    if (!ptls::ClientHandshake(sock, endpoint.host, verify_, tls, status,
                               error)) {
      pnet::CloseSocket(sock);
      return false;
    }
  }
  plog::Log(plog::Level::kDebug, "transport", "connected",
            {{"host", endpoint.host},
             {"port", std::to_string(endpoint.port)},
             {"tls", use_tls ? "1" : "0"}});
  out = std::make_unique<SocketStream>(sock, tls, use_tls);
  status = IoStatus::kOk;
  return true;
}

}  // namespace loco::client
