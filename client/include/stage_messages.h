#ifndef LOCO_CLIENT_STAGE_MESSAGES_H
#define LOCO_CLIENT_STAGE_MESSAGES_H

#include <cstdint>

#include "byte_stream.h"
#include "client_config.h"
#include "document.h"
#include "loco_error.h"
#include "packet.h"

namespace loco::client {

constexpr char kCommandGetConf[] = "GETCONF";
constexpr char kCommandCheckin[] = "CHECKIN";
constexpr char kCommandLoginList[] = "LOGINLIST";
constexpr char kCommandPing[] = "PING";

Document BuildGetConfRequest(const ClientIdentity& identity);
// Ticket host is ticket.lsl[0]; port is wifi.ports[0] or fallback_port.
bool ParseGetConfResponse(const Document& body, std::uint16_t fallback_port,
                          Endpoint& out, Failure& error);

Document BuildCheckinRequest(const ClientIdentity& identity,
                             std::int64_t user_id);
bool ParseCheckinResponse(const Document& body, Endpoint& out,
                          Failure& error);

// Reads the optional "status" field of a response body.
bool ReadBodyStatus(const Document& body, std::int64_t& out);

// Header status first, then the body field. Any non-zero value fails with
// kRemoteStatus carrying the code and command.
bool CheckResponseStatus(const PacketHeader& header, const Document& body,
                         Failure& error);

}  // namespace loco::client

#endif  // LOCO_CLIENT_STAGE_MESSAGES_H
