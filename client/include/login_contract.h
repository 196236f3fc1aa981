#ifndef LOCO_CLIENT_LOGIN_CONTRACT_H
#define LOCO_CLIENT_LOGIN_CONTRACT_H

#include <cstdint>
#include <memory>
#include <string>

#include "client_config.h"
#include "document.h"

namespace loco::client {

struct LoginCredentials {
  std::string oauth_token;
  std::int64_t user_id{0};
  std::string device_uuid;
};

struct LoginResult {
  std::int64_t user_id{0};
  std::size_t chat_count{0};
  Document body;
};

// Request and response schema of the Login stage. The field layout is only
// partially known, so each observed layout is a separate versioned contract.
class LoginContract {
 public:
  virtual ~LoginContract() = default;

  virtual const char* name() const = 0;
  virtual std::uint32_t version() const = 0;
  virtual const char* command() const = 0;

  virtual bool BuildRequest(const ClientIdentity& identity,
                            const LoginCredentials& credentials,
                            Document& out, std::string& error) const = 0;
  virtual bool ParseResponse(const Document& body, LoginResult& out,
                             std::string& error) const = 0;
};

// LOGINLIST as sent by the 4.x desktop client.
class LoginListContractV1 final : public LoginContract {
 public:
  const char* name() const override { return "loginlist-v1"; }
  std::uint32_t version() const override { return 1; }
  const char* command() const override;

  bool BuildRequest(const ClientIdentity& identity,
                    const LoginCredentials& credentials, Document& out,
                    std::string& error) const override;
  bool ParseResponse(const Document& body, LoginResult& out,
                     std::string& error) const override;
};

// nullptr for an unknown contract name.
std::unique_ptr<LoginContract> MakeLoginContract(const std::string& name);

}  // namespace loco::client

#endif  // LOCO_CLIENT_LOGIN_CONTRACT_H
