#pragma once

#include "routing/messages.h"
#include "vault/invitation_registry.h"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace vaultsim {
namespace vault {

using namespace vaultsim::common;

using routing::Authority;
using routing::RoutingMessage;

/**
 * Account - Per-client state kept by its client manager
 */
struct Account {
  uint64_t mutations_done = 0;
  uint64_t mutations_available = 0;
  std::set<crypto::PublicSignKey> auth_keys;
  uint64_t auth_keys_version = 0;

  routing::AccountInfo info() const {
    return routing::AccountInfo{mutations_done, mutations_available};
  }
};

/**
 * ClientManager - Account keeping for the clients whose manager name this
 * node is closest to
 *
 * Handles requests addressed to a ClientManager authority: account creation,
 * requester authorisation, mutation charging and forwarding to the data
 * managers, account queries and app key management. Responses from data
 * managers are relayed back to the originating client, refunding the charged
 * mutation when the operation failed.
 */
class ClientManager {
public:
  ClientManager(uint64_t account_mutations,
                std::shared_ptr<InvitationRegistry> invitations);

  std::vector<RoutingMessage> handle_request(const Authority &src,
                                             const Authority &dst,
                                             const routing::Request &request);

  std::vector<RoutingMessage> handle_response(const Authority &src,
                                              const Authority &dst,
                                              const routing::Response &response);

  std::optional<Account> account(const XorName &name) const;
  size_t account_count() const { return accounts_.size(); }

  /// Forwarded mutations still waiting for a data manager response
  size_t pending_operations() const { return pending_.size(); }

private:
  struct PendingOp {
    Authority client;
    XorName account_name;
    bool charged = false;
    bool creates_account = false;
    std::string invitation;
  };

  routing::ClientResult<bool> authorise(const Authority &src,
                                        const XorName &account_name,
                                        bool owner_only) const;

  std::vector<RoutingMessage> handle_account_creation(
      const Authority &src, const Authority &dst,
      const routing::Request &request, const routing::MutableData &data);

  std::vector<RoutingMessage> forward_mutation(const Authority &src,
                                               const Authority &dst,
                                               const routing::Request &request,
                                               const XorName &data_name);

  std::vector<RoutingMessage> handle_account_request(
      const Authority &src, const Authority &dst,
      const routing::Request &request);

  static RoutingMessage reply(const Authority &dst, const Authority &client,
                              routing::Response response);

  uint64_t account_mutations_;
  std::shared_ptr<InvitationRegistry> invitations_;
  std::map<XorName, Account> accounts_;
  std::map<routing::MessageId, PendingOp> pending_;
};

} // namespace vault
} // namespace vaultsim
