#pragma once

#include "common/rng.h"
#include "common/types.h"
#include "crypto/keys.h"
#include "routing/authority.h"
#include "routing/client_error.h"
#include "routing/data.h"
#include <cstdint>
#include <set>
#include <string>
#include <utility>
#include <variant>

namespace vaultsim {
namespace routing {

using namespace vaultsim::common;

/// Largest serialized client request a proxy accepts
constexpr size_t MAX_REQUEST_PAYLOAD_SIZE = 2 * 1024 * 1024;

/**
 * MessageId - Correlates a request with its response
 */
struct MessageId {
  XorName id{};

  static MessageId random(SeededRng &rng);

  bool operator==(const MessageId &other) const { return id == other.id; }
  bool operator!=(const MessageId &other) const { return id != other.id; }
  bool operator<(const MessageId &other) const { return id < other.id; }

  std::string to_string() const { return short_name(id); }
};

/// Request payloads, one per operation
namespace request {

struct PutIData {
  ImmutableData data;
};

struct GetIData {
  XorName name;
};

struct PutMData {
  MutableData data;
  PublicSignKey requester;
};

struct GetMDataVersion {
  XorName name;
  uint64_t tag;
};

struct GetMDataShell {
  XorName name;
  uint64_t tag;
};

struct ListMDataEntries {
  XorName name;
  uint64_t tag;
};

struct GetMDataValue {
  XorName name;
  uint64_t tag;
  Bytes key;
};

struct MutateMDataEntries {
  XorName name;
  uint64_t tag;
  EntryActionMap actions;
  PublicSignKey requester;
};

struct ListMDataPermissions {
  XorName name;
  uint64_t tag;
};

struct ListMDataUserPermissions {
  XorName name;
  uint64_t tag;
  User user;
};

struct SetMDataUserPermissions {
  XorName name;
  uint64_t tag;
  User user;
  PermissionSet permissions;
  uint64_t version;
  PublicSignKey requester;
};

struct DelMDataUserPermissions {
  XorName name;
  uint64_t tag;
  User user;
  uint64_t version;
  PublicSignKey requester;
};

// Authorised by the account of the forwarding client manager
struct ChangeMDataOwner {
  XorName name;
  uint64_t tag;
  Owners new_owners;
  uint64_t version;
};

struct GetAccountInfo {};

struct ListAuthKeysAndVersion {};

struct InsAuthKey {
  PublicSignKey key;
  uint64_t version;
};

struct DelAuthKey {
  PublicSignKey key;
  uint64_t version;
};

} // namespace request

using RequestBody =
    std::variant<request::PutIData, request::GetIData, request::PutMData,
                 request::GetMDataVersion, request::GetMDataShell,
                 request::ListMDataEntries, request::GetMDataValue,
                 request::MutateMDataEntries, request::ListMDataPermissions,
                 request::ListMDataUserPermissions,
                 request::SetMDataUserPermissions,
                 request::DelMDataUserPermissions, request::ChangeMDataOwner,
                 request::GetAccountInfo, request::ListAuthKeysAndVersion,
                 request::InsAuthKey, request::DelAuthKey>;

/**
 * Request - Payload plus the id its response will carry
 */
struct Request {
  RequestBody body;
  MessageId msg_id;

  /// Operation name, e.g. "PutIData"
  const char *name() const;

  /// true for requests that change state and are charged to an account
  bool is_mutation() const;
};

/// Response payloads, one per operation
namespace response {

struct PutIData {
  ClientResult<bool> res;
  MessageId msg_id;
  static constexpr const char *NAME = "PutIData";
};

struct GetIData {
  ClientResult<ImmutableData> res;
  MessageId msg_id;
  static constexpr const char *NAME = "GetIData";
};

struct PutMData {
  ClientResult<bool> res;
  MessageId msg_id;
  static constexpr const char *NAME = "PutMData";
};

struct GetMDataVersion {
  ClientResult<uint64_t> res;
  MessageId msg_id;
  static constexpr const char *NAME = "GetMDataVersion";
};

struct GetMDataShell {
  ClientResult<MutableData> res;
  MessageId msg_id;
  static constexpr const char *NAME = "GetMDataShell";
};

struct ListMDataEntries {
  ClientResult<Entries> res;
  MessageId msg_id;
  static constexpr const char *NAME = "ListMDataEntries";
};

struct GetMDataValue {
  ClientResult<Value> res;
  MessageId msg_id;
  static constexpr const char *NAME = "GetMDataValue";
};

struct MutateMDataEntries {
  ClientResult<bool> res;
  MessageId msg_id;
  static constexpr const char *NAME = "MutateMDataEntries";
};

struct ListMDataPermissions {
  ClientResult<Permissions> res;
  MessageId msg_id;
  static constexpr const char *NAME = "ListMDataPermissions";
};

struct ListMDataUserPermissions {
  ClientResult<PermissionSet> res;
  MessageId msg_id;
  static constexpr const char *NAME = "ListMDataUserPermissions";
};

struct SetMDataUserPermissions {
  ClientResult<bool> res;
  MessageId msg_id;
  static constexpr const char *NAME = "SetMDataUserPermissions";
};

struct DelMDataUserPermissions {
  ClientResult<bool> res;
  MessageId msg_id;
  static constexpr const char *NAME = "DelMDataUserPermissions";
};

struct ChangeMDataOwner {
  ClientResult<bool> res;
  MessageId msg_id;
  static constexpr const char *NAME = "ChangeMDataOwner";
};

struct GetAccountInfo {
  ClientResult<AccountInfo> res;
  MessageId msg_id;
  static constexpr const char *NAME = "GetAccountInfo";
};

using AuthKeysAndVersion = std::pair<std::set<PublicSignKey>, uint64_t>;

struct ListAuthKeysAndVersion {
  ClientResult<AuthKeysAndVersion> res;
  MessageId msg_id;
  static constexpr const char *NAME = "ListAuthKeysAndVersion";
};

struct InsAuthKey {
  ClientResult<bool> res;
  MessageId msg_id;
  static constexpr const char *NAME = "InsAuthKey";
};

struct DelAuthKey {
  ClientResult<bool> res;
  MessageId msg_id;
  static constexpr const char *NAME = "DelAuthKey";
};

} // namespace response

using Response =
    std::variant<response::PutIData, response::GetIData, response::PutMData,
                 response::GetMDataVersion, response::GetMDataShell,
                 response::ListMDataEntries, response::GetMDataValue,
                 response::MutateMDataEntries, response::ListMDataPermissions,
                 response::ListMDataUserPermissions,
                 response::SetMDataUserPermissions,
                 response::DelMDataUserPermissions, response::ChangeMDataOwner,
                 response::GetAccountInfo, response::ListAuthKeysAndVersion,
                 response::InsAuthKey, response::DelAuthKey>;

/**
 * ResponseFor - Response kind answering a request kind
 */
template <typename Req> struct ResponseFor;

#define VAULTSIM_RESPONSE_FOR(kind)                                            \
  template <> struct ResponseFor<request::kind> {                              \
    using type = response::kind;                                               \
  }

VAULTSIM_RESPONSE_FOR(PutIData);
VAULTSIM_RESPONSE_FOR(GetIData);
VAULTSIM_RESPONSE_FOR(PutMData);
VAULTSIM_RESPONSE_FOR(GetMDataVersion);
VAULTSIM_RESPONSE_FOR(GetMDataShell);
VAULTSIM_RESPONSE_FOR(ListMDataEntries);
VAULTSIM_RESPONSE_FOR(GetMDataValue);
VAULTSIM_RESPONSE_FOR(MutateMDataEntries);
VAULTSIM_RESPONSE_FOR(ListMDataPermissions);
VAULTSIM_RESPONSE_FOR(ListMDataUserPermissions);
VAULTSIM_RESPONSE_FOR(SetMDataUserPermissions);
VAULTSIM_RESPONSE_FOR(DelMDataUserPermissions);
VAULTSIM_RESPONSE_FOR(ChangeMDataOwner);
VAULTSIM_RESPONSE_FOR(GetAccountInfo);
VAULTSIM_RESPONSE_FOR(ListAuthKeysAndVersion);
VAULTSIM_RESPONSE_FOR(InsAuthKey);
VAULTSIM_RESPONSE_FOR(DelAuthKey);

#undef VAULTSIM_RESPONSE_FOR

MessageId response_msg_id(const Response &response);

/// Kind, id and outcome of a response for log lines
std::string describe(const Response &response);

/**
 * Build the failure response matching a request
 *
 * Every request kind maps to exactly one response kind.
 */
Response error_response(const Request &request, const ClientError &error);

/**
 * RoutingMessage - Authority-addressed message between nodes
 */
struct RoutingMessage {
  Authority src;
  Authority dst;
  std::variant<Request, Response> content;
};

/// Events surfaced to the owner of a routing client
namespace event {

struct Connected {};

struct Terminated {};

struct Response {
  routing::Response response;
  Authority src;
  Authority dst;
};

} // namespace event

using Event = std::variant<event::Connected, event::Terminated, event::Response>;

std::string describe(const Event &event);

/// Packets carried by the mock network
namespace packet {

struct BootstrapRequest {
  crypto::PublicKeys client_keys;
  crypto::Signature signature;
};

struct BootstrapResponse {
  bool accepted;
  XorName proxy_name;
};

struct ClientRequest {
  Authority dst;
  Request request;
};

struct ClientResponse {
  Authority src;
  Authority dst;
  Response response;
};

struct NodeMessage {
  RoutingMessage message;
};

struct Disconnect {
  std::string reason;
};

} // namespace packet

using Packet =
    std::variant<packet::BootstrapRequest, packet::BootstrapResponse,
                 packet::ClientRequest, packet::ClientResponse,
                 packet::NodeMessage, packet::Disconnect>;

/// Bytes a client signs to prove ownership of its bootstrap keys
Bytes bootstrap_challenge(const crypto::PublicKeys &keys);

} // namespace routing
} // namespace vaultsim
