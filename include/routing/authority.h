#pragma once

#include "crypto/keys.h"
#include "common/types.h"
#include <string>

namespace vaultsim {
namespace routing {

using namespace vaultsim::common;

/**
 * Authority - Source or destination of a routing message
 *
 * Client: a connected client, identified by its public keys and reachable
 * through its proxy node. ClientManager: the group managing the account of
 * the client whose name it carries. NaeManager: the group storing the data
 * whose name it carries.
 */
struct Authority {
  enum class Kind { Client, ClientManager, NaeManager };

  Kind kind = Kind::NaeManager;
  XorName name{};
  crypto::PublicKeys client_keys;
  XorName proxy_node_name{};

  static Authority client(const crypto::PublicKeys &keys,
                          const XorName &proxy_node_name);
  static Authority client_manager(const XorName &name);
  static Authority nae_manager(const XorName &name);

  bool is_client() const { return kind == Kind::Client; }

  bool operator==(const Authority &other) const;
  bool operator!=(const Authority &other) const { return !(*this == other); }

  std::string to_string() const;
};

} // namespace routing
} // namespace vaultsim
