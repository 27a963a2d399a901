#include "vault/invitation_registry.h"

namespace vaultsim {
namespace vault {

using routing::ClientError;
using routing::ClientResult;

void InvitationRegistry::add(const std::string &code) {
  invitations_.emplace(code, false);
}

ClientResult<bool> InvitationRegistry::claim(const std::string &code) {
  auto it = invitations_.find(code);
  if (it == invitations_.end()) {
    return ClientResult<bool>::failure(ClientError::Kind::InvalidInvitation);
  }
  if (it->second) {
    return ClientResult<bool>::failure(
        ClientError::Kind::InvitationAlreadyClaimed);
  }
  it->second = true;
  return ClientResult<bool>(true);
}

void InvitationRegistry::release(const std::string &code) {
  auto it = invitations_.find(code);
  if (it != invitations_.end()) {
    it->second = false;
  }
}

bool InvitationRegistry::is_claimed(const std::string &code) const {
  auto it = invitations_.find(code);
  return it != invitations_.end() && it->second;
}

} // namespace vault
} // namespace vaultsim
