#pragma once

#include "routing/client_error.h"
#include <map>
#include <string>

namespace vaultsim {
namespace vault {

using namespace vaultsim::common;

/**
 * InvitationRegistry - Invitation codes for invite-only account creation
 *
 * Shared by every client manager of a network. A code is claimed when an
 * account creation using it is forwarded, and released again if that
 * creation fails.
 */
class InvitationRegistry {
public:
  void add(const std::string &code);

  /// InvalidInvitation for unknown codes, InvitationAlreadyClaimed for used ones
  routing::ClientResult<bool> claim(const std::string &code);

  void release(const std::string &code);

  bool contains(const std::string &code) const {
    return invitations_.count(code) > 0;
  }
  bool is_claimed(const std::string &code) const;

private:
  std::map<std::string, bool> invitations_; ///< code -> claimed
};

} // namespace vault
} // namespace vaultsim
