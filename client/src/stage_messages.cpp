#include "stage_messages.h"

#include <limits>
#include <string>

namespace loco::client {

namespace {

bool ToPort(const Value& v, std::uint16_t& out) {
  if (!v.IsInteger()) {
    return false;
  }
  const std::int64_t port = v.AsInt64();
  if (port <= 0 || port > 65535) {
    return false;
  }
  out = static_cast<std::uint16_t>(port);
  return true;
}

}  // namespace

Document BuildGetConfRequest(const ClientIdentity& identity) {
  Document doc;
  doc.Set("MCCMNC", Value::String(identity.mccmnc));
  doc.Set("os", Value::String(identity.os));
  doc.Set("model", Value::String(identity.model));
  return doc;
}

bool ParseGetConfResponse(const Document& body, std::uint16_t fallback_port,
                          Endpoint& out, Failure& error) {
  const Document* ticket = body.GetDocument("ticket");
  const std::vector<Value>* lsl = ticket ? ticket->GetArray("lsl") : nullptr;
  if (!lsl || lsl->empty() || lsl->front().type() != ValueType::kString ||
      lsl->front().AsString().empty()) {
    error = MakeFailure(ErrorKind::kMalformedResponse,
                        "GETCONF response has no ticket.lsl host");
    return false;
  }
  out.host = lsl->front().AsString();
  out.port = fallback_port;
  const Document* wifi = body.GetDocument("wifi");
  const std::vector<Value>* ports = wifi ? wifi->GetArray("ports") : nullptr;
  if (ports && !ports->empty()) {
    if (!ToPort(ports->front(), out.port)) {
      error = MakeFailure(ErrorKind::kMalformedResponse,
                          "GETCONF response has an invalid wifi.ports entry");
      return false;
    }
  }
  return true;
}

Document BuildCheckinRequest(const ClientIdentity& identity,
                             std::int64_t user_id) {
  Document doc;
  doc.Set("userId", Value::Int64(user_id));
  doc.Set("os", Value::String(identity.os));
  doc.Set("ntype", Value::Int32(identity.network_type));
  doc.Set("appVer", Value::String(identity.app_version));
  doc.Set("MCCMNC", Value::String(identity.mccmnc));
  doc.Set("lang", Value::String(identity.language));
  doc.Set("countryISO", Value::String(identity.country_iso));
  doc.Set("useSub", Value::Bool(identity.use_sub));
  return doc;
}

bool ParseCheckinResponse(const Document& body, Endpoint& out,
                          Failure& error) {
  std::string host;
  if (!body.GetString("host", host) || host.empty()) {
    error = MakeFailure(ErrorKind::kMalformedResponse,
                        "CHECKIN response has no host");
    return false;
  }
  const Value* port = body.Find("port");
  std::uint16_t parsed = 0;
  if (!port || !ToPort(*port, parsed)) {
    error = MakeFailure(ErrorKind::kMalformedResponse,
                        "CHECKIN response has no valid port");
    return false;
  }
  out.host = std::move(host);
  out.port = parsed;
  return true;
}

bool ReadBodyStatus(const Document& body, std::int64_t& out) {
  return body.GetInteger("status", out);
}

bool CheckResponseStatus(const PacketHeader& header, const Document& body,
                         Failure& error) {
  std::int64_t status = header.status_code;
  if (status == kStatusOk) {
    if (!ReadBodyStatus(body, status)) {
      status = kStatusOk;
    }
  }
  if (status == kStatusOk) {
    return true;
  }
  if (status < std::numeric_limits<int>::min() ||
      status > std::numeric_limits<int>::max()) {
    error = MakeFailure(ErrorKind::kMalformedResponse,
                        "status " + std::to_string(status) + " out of range");
    error.command = header.command;
    return false;
  }
  error = MakeFailure(ErrorKind::kRemoteStatus,
                      std::string("server returned ") +
                          DescribeStatus(static_cast<int>(status)));
  error.status = static_cast<int>(status);
  error.command = header.command;
  return false;
}

}  // namespace loco::client
