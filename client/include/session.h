#ifndef LOCO_CLIENT_SESSION_H
#define LOCO_CLIENT_SESSION_H

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "byte_stream.h"
#include "client_config.h"
#include "document.h"
#include "login_contract.h"
#include "loco_crypto.h"
#include "loco_error.h"
#include "packet.h"
#include "secure_channel.h"
#include "unsolicited_queue.h"

namespace loco::client {

enum class SessionState : std::uint8_t {
  kIdle = 0,
  kBooking = 1,
  kBooked = 2,
  kCheckingIn = 3,
  kCheckedIn = 4,
  kLoggingIn = 5,
  kAuthenticated = 6,
  kFailed = 7
};

const char* SessionStateName(SessionState state);

struct Response {
  PacketHeader header;
  Document body;
};

// Booking -> Checkin -> Login over one connection at a time. Each stage is
// attempted once; a failed session is terminal and must be replaced.
// Construction applies config.log.level to the process-wide logger.
class Session {
 public:
  Session(ClientConfig config, std::unique_ptr<Transport> transport,
          std::unique_ptr<LoginContract> contract = nullptr);
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  // Runs all three stages from kIdle.
  bool Connect(const LoginCredentials& credentials, Failure& error);

  bool Book(Failure& error);
  bool CheckIn(const LoginCredentials& credentials, Failure& error);
  bool Login(const LoginCredentials& credentials, Failure& error);

  // Authenticated only. One request may be outstanding at a time; a second
  // concurrent call fails with kRequestInFlight.
  bool Request(const std::string& command, const Document& body,
               Response& out, Failure& error);
  bool Ping(Failure& error);

  // Moves any non-terminal session to kFailed{kCancelled}, unblocks pending
  // reads and wipes the crypto context. Safe from any thread.
  void Close();

  SessionState state() const;
  Failure failure() const;
  Endpoint ticket_endpoint() const;
  Endpoint loco_endpoint() const;
  LoginResult login_result() const;

  UnsolicitedQueue& unsolicited() { return unsolicited_; }

 private:
  struct PendingRequest {
    bool active{false};
    bool done{false};
    std::uint32_t packet_id{0};
    std::string command;
    Packet response;
  };

  bool BeginStage(SessionState expected, SessionState running, Stage stage,
                  Failure& error);
  bool FinishStage(SessionState next, Failure& error);
  bool FailStage(Stage stage, Failure failure, Failure& error);

  bool EnsurePublicKey(Failure& error);
  bool OpenChannel(const Endpoint& endpoint, Security security,
                   std::uint32_t timeout_ms,
                   std::shared_ptr<SecureChannel>& out, Failure& error);
  bool Handshake(SecureChannel& channel, Failure& error);
  bool Exchange(SecureChannel& channel, const std::string& command,
                const Document& body, Response& out, Failure& error,
                std::uint32_t* sent_id = nullptr);
  void ReleaseChannel();

  void ReceiveLoop(std::shared_ptr<SecureChannel> channel);
  bool MatchesPending(const Packet& packet) const;

  ClientConfig config_;
  std::unique_ptr<Transport> transport_;
  std::unique_ptr<LoginContract> contract_;
  ServerPublicKey public_key_;
  PacketIdCounter ids_;
  UnsolicitedQueue unsolicited_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  SessionState state_{SessionState::kIdle};
  Failure failure_;
  bool cancelled_{false};
  std::uint64_t stage_started_ms_{0};
  Endpoint ticket_;
  Endpoint loco_;
  LoginResult login_;
  // Learned from the login reply; selects id or command correlation.
  bool ids_echoed_{true};
  std::shared_ptr<SecureChannel> channel_;
  PendingRequest pending_;

  std::thread receiver_;
};

}  // namespace loco::client

#endif  // LOCO_CLIENT_SESSION_H
