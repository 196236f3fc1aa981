#include "login_contract.h"

#include <vector>

#include "stage_messages.h"

namespace loco::client {

const char* LoginListContractV1::command() const {
  return kCommandLoginList;
}

bool LoginListContractV1::BuildRequest(const ClientIdentity& identity,
                                       const LoginCredentials& credentials,
                                       Document& out,
                                       std::string& error) const {
  if (credentials.oauth_token.empty()) {
    error = "oauth token missing";
    return false;
  }
  if (credentials.device_uuid.empty()) {
    error = "device uuid missing";
    return false;
  }
  out.Clear();
  out.Set("os", Value::String(identity.os));
  out.Set("ntype", Value::Int32(identity.network_type));
  out.Set("appVer", Value::String(identity.app_version));
  out.Set("MCCMNC", Value::String(identity.mccmnc));
  out.Set("prtVer", Value::String(identity.protocol_version));
  out.Set("duuid", Value::String(credentials.device_uuid));
  out.Set("oauthToken", Value::String(credentials.oauth_token));
  out.Set("lang", Value::String(identity.language));
  out.Set("dtype", Value::Int32(identity.device_type));
  out.Set("revision", Value::Int32(0));
  out.Set("chatIds", Value::Array({}));
  out.Set("maxIds", Value::Array({}));
  out.Set("lastTokenId", Value::Int32(0));
  out.Set("lbk", Value::Int32(0));
  out.Set("bg", Value::Bool(false));
  return true;
}

bool LoginListContractV1::ParseResponse(const Document& body,
                                        LoginResult& out,
                                        std::string& error) const {
  if (!body.GetInteger("userId", out.user_id) || out.user_id == 0) {
    error = "LOGINLIST response has no userId";
    return false;
  }
  const std::vector<Value>* chats = body.GetArray("chatDatas");
  out.chat_count = chats ? chats->size() : 0;
  out.body = body;
  return true;
}

std::unique_ptr<LoginContract> MakeLoginContract(const std::string& name) {
  if (name == "loginlist-v1" || name == "loginlist") {
    return std::make_unique<LoginListContractV1>();
  }
  return nullptr;
}

}  // namespace loco::client
