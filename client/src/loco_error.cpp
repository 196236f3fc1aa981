#include "loco_error.h"

#include <utility>

namespace loco::client {

Failure MakeFailure(ErrorKind kind, std::string message) {
  Failure out;
  out.kind = kind;
  out.message = std::move(message);
  return out;
}

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "none";
    case ErrorKind::kTransport:
      return "transport";
    case ErrorKind::kConnectionClosed:
      return "connection closed";
    case ErrorKind::kTimeout:
      return "timeout";
    case ErrorKind::kMalformedHeader:
      return "malformed header";
    case ErrorKind::kTruncatedInput:
      return "truncated input";
    case ErrorKind::kUnknownTypeTag:
      return "unknown type tag";
    case ErrorKind::kMalformedDocument:
      return "malformed document";
    case ErrorKind::kMalformedResponse:
      return "malformed response";
    case ErrorKind::kKeyFormat:
      return "key format";
    case ErrorKind::kHandshakeRejected:
      return "handshake rejected";
    case ErrorKind::kRemoteStatus:
      return "remote status";
    case ErrorKind::kCancelled:
      return "cancelled";
    case ErrorKind::kInvalidState:
      return "invalid state";
    case ErrorKind::kRequestInFlight:
      return "request in flight";
    case ErrorKind::kEntropy:
      return "entropy";
  }
  return "unknown";
}

const char* StageName(Stage stage) {
  switch (stage) {
    case Stage::kNone:
      return "none";
    case Stage::kBooking:
      return "booking";
    case Stage::kCheckin:
      return "checkin";
    case Stage::kLogin:
      return "login";
    case Stage::kRequest:
      return "request";
  }
  return "unknown";
}

const char* DescribeStatus(int status) {
  switch (status) {
    case kStatusOk:
      return "ok";
    case kStatusTokenExpired:
      return "token expired";
    case kStatusInvalidDevice:
      return "invalid device";
    case kStatusAuthError:
      return "authentication error";
    default:
      break;
  }
  return "unknown status";
}

std::string DescribeFailure(const Failure& failure) {
  if (failure.ok()) {
    return "ok";
  }
  std::string out = StageName(failure.stage);
  out.append(": ");
  out.append(ErrorKindName(failure.kind));
  if (failure.kind == ErrorKind::kRemoteStatus) {
    out.append(" ");
    out.append(std::to_string(failure.status));
    out.append(" (");
    out.append(failure.remote == RemoteStatusKind::kTokenInvalid
                   ? "token invalid"
                   : DescribeStatus(failure.status));
    out.append(")");
    if (!failure.command.empty()) {
      out.append(" from ");
      out.append(failure.command);
    }
  }
  if (!failure.message.empty()) {
    out.append(": ");
    out.append(failure.message);
  }
  return out;
}

}  // namespace loco::client
