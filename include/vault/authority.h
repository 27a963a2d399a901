#pragma once

#include "crypto/keys.h"
#include "routing/authority.h"
#include "common/types.h"

namespace vaultsim {
namespace vault {

using namespace vaultsim::common;

/**
 * ClientAuthority - A connected client and the node relaying its traffic
 */
struct ClientAuthority {
  crypto::PublicKeys client_pub_id;
  XorName proxy_node_name{};

  /// Network name of the client, derived from its signing key
  const XorName &name() const { return client_pub_id.name(); }

  const crypto::PublicSignKey &client_key() const {
    return client_pub_id.public_sign_key();
  }

  operator routing::Authority() const {
    return routing::Authority::client(client_pub_id, proxy_node_name);
  }

  bool operator==(const ClientAuthority &other) const {
    return client_pub_id == other.client_pub_id &&
           proxy_node_name == other.proxy_node_name;
  }
};

/**
 * ClientManagerAuthority - The group managing one client's account
 */
class ClientManagerAuthority {
public:
  explicit ClientManagerAuthority(const XorName &name) : name_(name) {}

  /// Manager of the client owning `client_key`
  static ClientManagerAuthority for_client(const crypto::PublicSignKey &client_key) {
    return ClientManagerAuthority(crypto::name_from_key(client_key));
  }

  const XorName &name() const { return name_; }

  operator routing::Authority() const {
    return routing::Authority::client_manager(name_);
  }

  bool operator==(const ClientManagerAuthority &other) const {
    return name_ == other.name_;
  }
  bool operator!=(const ClientManagerAuthority &other) const {
    return name_ != other.name_;
  }

private:
  XorName name_;
};

} // namespace vault
} // namespace vaultsim
