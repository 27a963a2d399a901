#pragma once

#include "common/types.h"
#include <cstdint>
#include <map>
#include <string>

namespace vaultsim {
namespace routing {

using namespace vaultsim::common;

/**
 * EntryError - Why a single entry action was rejected
 */
struct EntryError {
  enum class Kind { NoSuchEntry, EntryExists, InvalidSuccessor };

  Kind kind = Kind::NoSuchEntry;
  uint64_t current_version = 0;

  bool operator==(const EntryError &other) const {
    return kind == other.kind && current_version == other.current_version;
  }
  bool operator!=(const EntryError &other) const { return !(*this == other); }
};

/**
 * ClientError - Protocol-level failure carried back in a response
 *
 * `current_version` is meaningful for InvalidSuccessor, `entry_errors` for
 * InvalidEntryActions and `description` for NetworkOther.
 */
struct ClientError {
  enum class Kind {
    AccessDenied,
    NoSuchAccount,
    AccountExists,
    NoSuchData,
    DataExists,
    DataTooLarge,
    NoSuchEntry,
    InvalidEntryActions,
    NoSuchKey,
    InvalidOwners,
    InvalidSuccessor,
    InvalidOperation,
    LowBalance,
    NetworkFull,
    NetworkOther,
    InvalidInvitation,
    InvitationAlreadyClaimed,
    TooManyEntries
  };

  Kind kind = Kind::NetworkOther;
  std::string description;
  uint64_t current_version = 0;
  std::map<Bytes, EntryError> entry_errors;

  ClientError() = default;
  ClientError(Kind k) : kind(k) {}

  static ClientError network_other(const std::string &message);
  static ClientError invalid_successor(uint64_t current);
  static ClientError invalid_entry_actions(std::map<Bytes, EntryError> errors);

  bool operator==(const ClientError &other) const;
  bool operator!=(const ClientError &other) const { return !(*this == other); }

  std::string to_string() const;
};

const char *kind_name(ClientError::Kind kind);

/// Result of a client-facing operation
template <typename T> using ClientResult = Result<T, ClientError>;

} // namespace routing
} // namespace vaultsim
