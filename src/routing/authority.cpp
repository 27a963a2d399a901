#include "routing/authority.h"

namespace vaultsim {
namespace routing {

Authority Authority::client(const crypto::PublicKeys &keys,
                            const XorName &proxy_node_name) {
  Authority authority;
  authority.kind = Kind::Client;
  authority.name = keys.name();
  authority.client_keys = keys;
  authority.proxy_node_name = proxy_node_name;
  return authority;
}

Authority Authority::client_manager(const XorName &name) {
  Authority authority;
  authority.kind = Kind::ClientManager;
  authority.name = name;
  return authority;
}

Authority Authority::nae_manager(const XorName &name) {
  Authority authority;
  authority.kind = Kind::NaeManager;
  authority.name = name;
  return authority;
}

bool Authority::operator==(const Authority &other) const {
  if (kind != other.kind || name != other.name) {
    return false;
  }
  if (kind == Kind::Client) {
    return client_keys == other.client_keys &&
           proxy_node_name == other.proxy_node_name;
  }
  return true;
}

std::string Authority::to_string() const {
  switch (kind) {
  case Kind::Client:
    return "Client { name: " + short_name(name) +
           ", proxy: " + short_name(proxy_node_name) + " }";
  case Kind::ClientManager:
    return "ClientManager(" + short_name(name) + ")";
  case Kind::NaeManager:
    return "NaeManager(" + short_name(name) + ")";
  }
  return "Unknown";
}

} // namespace routing
} // namespace vaultsim
