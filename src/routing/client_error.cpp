#include "routing/client_error.h"
#include <sstream>

namespace vaultsim {
namespace routing {

const char *kind_name(ClientError::Kind kind) {
  switch (kind) {
  case ClientError::Kind::AccessDenied:
    return "AccessDenied";
  case ClientError::Kind::NoSuchAccount:
    return "NoSuchAccount";
  case ClientError::Kind::AccountExists:
    return "AccountExists";
  case ClientError::Kind::NoSuchData:
    return "NoSuchData";
  case ClientError::Kind::DataExists:
    return "DataExists";
  case ClientError::Kind::DataTooLarge:
    return "DataTooLarge";
  case ClientError::Kind::NoSuchEntry:
    return "NoSuchEntry";
  case ClientError::Kind::InvalidEntryActions:
    return "InvalidEntryActions";
  case ClientError::Kind::NoSuchKey:
    return "NoSuchKey";
  case ClientError::Kind::InvalidOwners:
    return "InvalidOwners";
  case ClientError::Kind::InvalidSuccessor:
    return "InvalidSuccessor";
  case ClientError::Kind::InvalidOperation:
    return "InvalidOperation";
  case ClientError::Kind::LowBalance:
    return "LowBalance";
  case ClientError::Kind::NetworkFull:
    return "NetworkFull";
  case ClientError::Kind::NetworkOther:
    return "NetworkOther";
  case ClientError::Kind::InvalidInvitation:
    return "InvalidInvitation";
  case ClientError::Kind::InvitationAlreadyClaimed:
    return "InvitationAlreadyClaimed";
  case ClientError::Kind::TooManyEntries:
    return "TooManyEntries";
  }
  return "Unknown";
}

ClientError ClientError::network_other(const std::string &message) {
  ClientError error(Kind::NetworkOther);
  error.description = message;
  return error;
}

ClientError ClientError::invalid_successor(uint64_t current) {
  ClientError error(Kind::InvalidSuccessor);
  error.current_version = current;
  return error;
}

ClientError
ClientError::invalid_entry_actions(std::map<Bytes, EntryError> errors) {
  ClientError error(Kind::InvalidEntryActions);
  error.entry_errors = std::move(errors);
  return error;
}

bool ClientError::operator==(const ClientError &other) const {
  return kind == other.kind && description == other.description &&
         current_version == other.current_version &&
         entry_errors == other.entry_errors;
}

std::string ClientError::to_string() const {
  std::ostringstream oss;
  oss << kind_name(kind);
  switch (kind) {
  case Kind::NetworkOther:
    oss << "(" << description << ")";
    break;
  case Kind::InvalidSuccessor:
    oss << "(" << current_version << ")";
    break;
  case Kind::InvalidEntryActions:
    oss << "(" << entry_errors.size() << " entries)";
    break;
  default:
    break;
  }
  return oss.str();
}

} // namespace routing
} // namespace vaultsim
