#include "session.h"

#include <chrono>
#include <utility>

#include "platform_log.h"
#include "platform_time.h"
#include "secure_buffer.h"
#include "stage_messages.h"

namespace loco::client {

namespace plog = platform::log;

namespace {

constexpr char kLogTag[] = "session";

Stage StageForState(SessionState state) {
  switch (state) {
    case SessionState::kBooking:
      return Stage::kBooking;
    case SessionState::kCheckingIn:
      return Stage::kCheckin;
    case SessionState::kLoggingIn:
      return Stage::kLogin;
    case SessionState::kAuthenticated:
      return Stage::kRequest;
    default:
      break;
  }
  return Stage::kNone;
}

}  // namespace

const char* SessionStateName(SessionState state) {
  switch (state) {
    case SessionState::kIdle:
      return "idle";
    case SessionState::kBooking:
      return "booking";
    case SessionState::kBooked:
      return "booked";
    case SessionState::kCheckingIn:
      return "checking_in";
    case SessionState::kCheckedIn:
      return "checked_in";
    case SessionState::kLoggingIn:
      return "logging_in";
    case SessionState::kAuthenticated:
      return "authenticated";
    case SessionState::kFailed:
      return "failed";
  }
  return "unknown";
}

Session::Session(ClientConfig config, std::unique_ptr<Transport> transport,
                 std::unique_ptr<LoginContract> contract)
    : config_(std::move(config)),
      transport_(std::move(transport)),
      contract_(std::move(contract)) {
  plog::SetMinLevel(config_.log.level);
  if (!contract_) {
    contract_ = MakeLoginContract(config_.login.contract);
  }
  if (config_.handshake.key_type != kDefaultHandshakeKeyType) {
    plog::Log(plog::Level::kWarn, kLogTag,
              "handshake key type overridden; the server drops connections "
              "using any other value",
              {{"key_type", std::to_string(config_.handshake.key_type)},
               {"default_key_type", std::to_string(kDefaultHandshakeKeyType)}});
  }
}

Session::~Session() {
  Close();
}

bool Session::Connect(const LoginCredentials& credentials, Failure& error) {
  return Book(error) && CheckIn(credentials, error) &&
         Login(credentials, error);
}

bool Session::BeginStage(SessionState expected, SessionState running,
                         Stage stage, Failure& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != expected) {
    error = MakeFailure(ErrorKind::kInvalidState,
                        std::string("stage needs state ") +
                            SessionStateName(expected) + ", session is " +
                            SessionStateName(state_));
    error.stage = stage;
    return false;
  }
  state_ = running;
  stage_started_ms_ = platform::NowSteadyMs();
  plog::Log(plog::Level::kInfo, kLogTag, "stage started",
            {{"stage", StageName(stage)}});
  return true;
}

bool Session::FinishStage(SessionState next, Failure& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cancelled_) {
    error = failure_;
    return false;
  }
  state_ = next;
  plog::Log(plog::Level::kInfo, kLogTag, "state changed",
            {{"state", SessionStateName(next)},
             {"elapsed_ms",
              std::to_string(platform::NowSteadyMs() - stage_started_ms_)}});
  return true;
}

bool Session::FailStage(Stage stage, Failure failure, Failure& error) {
  ReleaseChannel();
  std::lock_guard<std::mutex> lock(mutex_);
  if (cancelled_ || state_ == SessionState::kFailed) {
    error = failure_;
    return false;
  }
  failure.stage = stage;
  failure_ = std::move(failure);
  state_ = SessionState::kFailed;
  error = failure_;
  unsolicited_.Close();
  cv_.notify_all();
  plog::Log(plog::Level::kError, kLogTag, "stage failed",
            {{"stage", StageName(stage)},
             {"kind", ErrorKindName(failure_.kind)},
             {"status", std::to_string(failure_.status)},
             {"elapsed_ms",
              std::to_string(platform::NowSteadyMs() - stage_started_ms_)},
             {"detail", failure_.message}});
  return false;
}

bool Session::EnsurePublicKey(Failure& error) {
  if (public_key_.loaded()) {
    return true;
  }
  return LoadServerPublicKey(config_.handshake.public_key, public_key_, error);
}

bool Session::OpenChannel(const Endpoint& endpoint, Security security,
                          std::uint32_t timeout_ms,
                          std::shared_ptr<SecureChannel>& out,
                          Failure& error) {
  std::unique_ptr<ByteStream> stream;
  IoStatus status = IoStatus::kError;
  std::string connect_error;
  if (!transport_->Connect(endpoint, security, timeout_ms, stream, status,
                           connect_error)) {
    const ErrorKind kind = status == IoStatus::kTimeout ? ErrorKind::kTimeout
                                                        : ErrorKind::kTransport;
    error = MakeFailure(kind,
                        "connect " + endpoint.host + ":" +
                            std::to_string(endpoint.port) + " failed: " +
                            connect_error);
    return false;
  }
  auto channel = std::make_shared<SecureChannel>(std::move(stream));
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cancelled_) {
      channel_ = channel;
      out = std::move(channel);
      return true;
    }
  }
  channel->Close();
  error = MakeFailure(ErrorKind::kCancelled, "session closed");
  return false;
}

bool Session::Handshake(SecureChannel& channel, Failure& error) {
  if (!EnsurePublicKey(error)) {
    return false;
  }
  CryptoContext context;
  if (!CreateHandshake(config_.handshake.key_type, context, error)) {
    return false;
  }
  return channel.SendHandshake(std::move(context), public_key_, error);
}

bool Session::Exchange(SecureChannel& channel, const std::string& command,
                       const Document& body, Response& out, Failure& error,
                       std::uint32_t* sent_id) {
  Packet request;
  if (!MakeDocumentPacket(ids_.Next(), command, body, request)) {
    error = MakeFailure(ErrorKind::kMalformedDocument,
                        "request encode failed for " + command);
    return false;
  }
  common::ScopedWipe request_wipe(request.body);
  if (sent_id) {
    *sent_id = request.header.packet_id;
  }
  if (!channel.Send(request, error)) {
    return false;
  }
  Packet reply;
  if (!channel.Receive(reply, error)) {
    return false;
  }
  if (reply.header.command != command) {
    error = MakeFailure(ErrorKind::kMalformedResponse,
                        "expected " + command + " reply, got " +
                            reply.header.command);
    error.command = reply.header.command;
    return false;
  }
  CodecError codec_error = CodecError::kNone;
  if (!DecodeBodyDocument(reply, out.body, codec_error)) {
    error = MakeFailure(CodecErrorKind(codec_error),
                        std::string(command) + " body: " +
                            CodecErrorName(codec_error));
    error.command = command;
    return false;
  }
  out.header = reply.header;
  return CheckResponseStatus(out.header, out.body, error);
}

void Session::ReleaseChannel() {
  std::shared_ptr<SecureChannel> channel;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    channel = std::move(channel_);
  }
  if (channel) {
    channel->Close();
  }
}

bool Session::Book(Failure& error) {
  if (!BeginStage(SessionState::kIdle, SessionState::kBooking,
                  Stage::kBooking, error)) {
    return false;
  }
  const Endpoint booking{config_.booking.host, config_.booking.port};
  std::shared_ptr<SecureChannel> channel;
  Failure failure;
  if (!OpenChannel(booking, Security::kTls, config_.booking.timeout_ms,
                   channel, failure)) {
    return FailStage(Stage::kBooking, std::move(failure), error);
  }
  Response response;
  if (!Exchange(*channel, kCommandGetConf,
                BuildGetConfRequest(config_.identity), response, failure)) {
    return FailStage(Stage::kBooking, std::move(failure), error);
  }
  Endpoint ticket;
  if (!ParseGetConfResponse(response.body, config_.checkin.fallback_port,
                            ticket, failure)) {
    return FailStage(Stage::kBooking, std::move(failure), error);
  }
  ReleaseChannel();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ticket_ = ticket;
  }
  plog::Log(plog::Level::kInfo, kLogTag, "ticket host assigned",
            {{"host", ticket.host}, {"port", std::to_string(ticket.port)}});
  return FinishStage(SessionState::kBooked, error);
}

bool Session::CheckIn(const LoginCredentials& credentials, Failure& error) {
  if (!BeginStage(SessionState::kBooked, SessionState::kCheckingIn,
                  Stage::kCheckin, error)) {
    return false;
  }
  const Endpoint ticket = ticket_endpoint();
  std::shared_ptr<SecureChannel> channel;
  Failure failure;
  if (!OpenChannel(ticket, Security::kPlain, config_.checkin.timeout_ms,
                   channel, failure) ||
      !Handshake(*channel, failure)) {
    return FailStage(Stage::kCheckin, std::move(failure), error);
  }
  Response response;
  if (!Exchange(*channel, kCommandCheckin,
                BuildCheckinRequest(config_.identity, credentials.user_id),
                response, failure)) {
    return FailStage(Stage::kCheckin, std::move(failure), error);
  }
  Endpoint loco;
  if (!ParseCheckinResponse(response.body, loco, failure)) {
    return FailStage(Stage::kCheckin, std::move(failure), error);
  }
  ReleaseChannel();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    loco_ = loco;
  }
  plog::Log(plog::Level::kInfo, kLogTag, "loco host assigned",
            {{"host", loco.host}, {"port", std::to_string(loco.port)}});
  return FinishStage(SessionState::kCheckedIn, error);
}

bool Session::Login(const LoginCredentials& credentials, Failure& error) {
  if (!BeginStage(SessionState::kCheckedIn, SessionState::kLoggingIn,
                  Stage::kLogin, error)) {
    return false;
  }
  Failure failure;
  if (!contract_) {
    failure = MakeFailure(ErrorKind::kInvalidState,
                          "unknown login contract " + config_.login.contract);
    return FailStage(Stage::kLogin, std::move(failure), error);
  }
  Document request;
  std::string build_error;
  if (!contract_->BuildRequest(config_.identity, credentials, request,
                               build_error)) {
    failure = MakeFailure(ErrorKind::kInvalidState, build_error);
    return FailStage(Stage::kLogin, std::move(failure), error);
  }
  const Endpoint loco = loco_endpoint();
  std::shared_ptr<SecureChannel> channel;
  if (!OpenChannel(loco, Security::kPlain, config_.login.timeout_ms, channel,
                   failure) ||
      !Handshake(*channel, failure)) {
    return FailStage(Stage::kLogin, std::move(failure), error);
  }
  Response response;
  std::uint32_t login_id = 0;
  if (!Exchange(*channel, contract_->command(), request, response, failure,
                &login_id)) {
    if (failure.kind == ErrorKind::kRemoteStatus &&
        failure.status == config_.login.token_invalid_status) {
      failure.remote = RemoteStatusKind::kTokenInvalid;
    }
    return FailStage(Stage::kLogin, std::move(failure), error);
  }
  LoginResult result;
  std::string parse_error;
  if (!contract_->ParseResponse(response.body, result, parse_error)) {
    failure = MakeFailure(ErrorKind::kMalformedResponse, parse_error);
    failure.command = contract_->command();
    return FailStage(Stage::kLogin, std::move(failure), error);
  }
  // Requests carry their own deadline from here on.
  if (!channel->SetReadTimeout(0)) {
    failure = MakeFailure(ErrorKind::kTransport, "read timeout reset failed");
    return FailStage(Stage::kLogin, std::move(failure), error);
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cancelled_) {
      login_ = std::move(result);
      ids_echoed_ = response.header.packet_id == login_id;
      state_ = SessionState::kAuthenticated;
      plog::Log(plog::Level::kInfo, kLogTag, "state changed",
                {{"state", SessionStateName(state_)},
                 {"user_id", std::to_string(login_.user_id)},
                 {"ids_echoed", ids_echoed_ ? "1" : "0"}});
      receiver_ = std::thread(&Session::ReceiveLoop, this, channel);
      return true;
    }
    error = failure_;
  }
  ReleaseChannel();
  return false;
}

bool Session::MatchesPending(const Packet& packet) const {
  if (!pending_.active || pending_.done) {
    return false;
  }
  // A server that echoed the login packet id is matched on id alone; pushes
  // reusing the request's command name stay unsolicited.
  if (ids_echoed_) {
    return packet.header.packet_id == pending_.packet_id;
  }
  return packet.header.command == pending_.command;
}

void Session::ReceiveLoop(std::shared_ptr<SecureChannel> channel) {
  while (true) {
    Packet packet;
    Failure failure;
    if (!channel->Receive(packet, failure)) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::kFailed) {
          failure.stage = Stage::kRequest;
          failure_ = failure;
          state_ = SessionState::kFailed;
          plog::Log(plog::Level::kError, kLogTag, "connection lost",
                    {{"kind", ErrorKindName(failure.kind)},
                     {"detail", failure.message}});
        }
        if (channel_ == channel) {
          channel_.reset();
        }
        unsolicited_.Close();
        cv_.notify_all();
      }
      // This thread is the only reader; Close waits out a concurrent Send
      // and wipes the crypto context.
      channel->Close();
      return;
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (MatchesPending(packet)) {
        pending_.response = std::move(packet);
        pending_.done = true;
        cv_.notify_all();
        continue;
      }
    }
    plog::Log(plog::Level::kDebug, kLogTag, "unsolicited packet",
              {{"command", packet.header.command}});
    unsolicited_.Push(std::move(packet));
  }
}

bool Session::Request(const std::string& command, const Document& body,
                      Response& out, Failure& error) {
  std::shared_ptr<SecureChannel> channel;
  Packet request;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::kAuthenticated || !channel_) {
      error = MakeFailure(ErrorKind::kInvalidState,
                          std::string("request needs an authenticated "
                                      "session, session is ") +
                              SessionStateName(state_));
      error.stage = Stage::kRequest;
      return false;
    }
    if (pending_.active) {
      error = MakeFailure(ErrorKind::kRequestInFlight,
                          "request " + pending_.command + " still pending");
      error.stage = Stage::kRequest;
      return false;
    }
    if (!MakeDocumentPacket(ids_.Next(), command, body, request)) {
      error = MakeFailure(ErrorKind::kMalformedDocument,
                          "request encode failed for " + command);
      error.stage = Stage::kRequest;
      return false;
    }
    pending_ = PendingRequest{};
    pending_.active = true;
    pending_.packet_id = request.header.packet_id;
    pending_.command = command;
    channel = channel_;
  }

  if (!channel->Send(request, error)) {
    error.stage = Stage::kRequest;
    std::lock_guard<std::mutex> lock(mutex_);
    pending_ = PendingRequest{};
    channel->Shutdown();
    return false;
  }

  Packet reply;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool finished = cv_.wait_for(
        lock, std::chrono::milliseconds(config_.login.request_timeout_ms),
        [this] { return pending_.done || state_ == SessionState::kFailed; });
    const bool done = pending_.done;
    reply = std::move(pending_.response);
    pending_ = PendingRequest{};
    if (!done) {
      if (finished) {
        error = failure_;
      } else {
        error = MakeFailure(ErrorKind::kTimeout, command + " timed out");
      }
      error.stage = Stage::kRequest;
      return false;
    }
  }

  CodecError codec_error = CodecError::kNone;
  if (!DecodeBodyDocument(reply, out.body, codec_error)) {
    error = MakeFailure(CodecErrorKind(codec_error),
                        command + " body: " + CodecErrorName(codec_error));
    error.stage = Stage::kRequest;
    error.command = command;
    return false;
  }
  out.header = reply.header;
  if (!CheckResponseStatus(out.header, out.body, error)) {
    error.stage = Stage::kRequest;
    return false;
  }
  return true;
}

bool Session::Ping(Failure& error) {
  Response response;
  return Request(kCommandPing, Document(), response, error);
}

void Session::Close() {
  std::shared_ptr<SecureChannel> channel;
  bool join = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::kFailed) {
      failure_ = MakeFailure(ErrorKind::kCancelled, "session closed");
      failure_.stage = StageForState(state_);
      state_ = SessionState::kFailed;
      cancelled_ = true;
      plog::Log(plog::Level::kInfo, kLogTag, "session closed");
    }
    if (channel_) {
      channel_->Shutdown();
    }
    // A stage running on another thread releases its own channel.
    join = receiver_.joinable();
    if (join) {
      channel = std::move(channel_);
    }
    unsolicited_.Close();
    cv_.notify_all();
  }
  if (join && receiver_.get_id() != std::this_thread::get_id()) {
    receiver_.join();
  }
  if (channel) {
    channel->Close();
  }
}

SessionState Session::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

Failure Session::failure() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failure_;
}

Endpoint Session::ticket_endpoint() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ticket_;
}

Endpoint Session::loco_endpoint() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return loco_;
}

LoginResult Session::login_result() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return login_;
}

}  // namespace loco::client
