#ifndef LOCO_CLIENT_LOCO_ERROR_H
#define LOCO_CLIENT_LOCO_ERROR_H

#include <cstdint>
#include <string>

namespace loco::client {

enum class ErrorKind : std::uint8_t {
  kNone = 0,
  kTransport = 1,
  kConnectionClosed = 2,
  kTimeout = 3,
  kMalformedHeader = 4,
  kTruncatedInput = 5,
  kUnknownTypeTag = 6,
  kMalformedDocument = 7,
  kMalformedResponse = 8,
  kKeyFormat = 9,
  kHandshakeRejected = 10,
  kRemoteStatus = 11,
  kCancelled = 12,
  kInvalidState = 13,
  kRequestInFlight = 14,
  kEntropy = 15
};

enum class Stage : std::uint8_t {
  kNone = 0,
  kBooking = 1,
  kCheckin = 2,
  kLogin = 3,
  kRequest = 4
};

enum class RemoteStatusKind : std::uint8_t { kGeneric = 0, kTokenInvalid = 1 };

constexpr int kStatusOk = 0;
constexpr int kStatusTokenExpired = -950;
constexpr int kStatusInvalidDevice = -300;
constexpr int kStatusAuthError = -203;

struct Failure {
  ErrorKind kind{ErrorKind::kNone};
  Stage stage{Stage::kNone};
  RemoteStatusKind remote{RemoteStatusKind::kGeneric};
  int status{0};
  std::string command;
  std::string message;

  bool ok() const { return kind == ErrorKind::kNone; }
  bool IsTokenInvalid() const {
    return kind == ErrorKind::kRemoteStatus &&
           remote == RemoteStatusKind::kTokenInvalid;
  }
};

Failure MakeFailure(ErrorKind kind, std::string message);

const char* ErrorKindName(ErrorKind kind);
const char* StageName(Stage stage);
// Names the status codes seen from the server; unknown codes map to
// "unknown status".
const char* DescribeStatus(int status);
std::string DescribeFailure(const Failure& failure);

}  // namespace loco::client

#endif  // LOCO_CLIENT_LOCO_ERROR_H
