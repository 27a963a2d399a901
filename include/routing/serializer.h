#pragma once

#include "routing/data.h"
#include "routing/messages.h"
#include <cstdint>
#include <string>
#include <vector>

namespace vaultsim {
namespace routing {

using namespace vaultsim::common;

/**
 * Serialization utilities for routing payloads
 * Little-endian integers, u64 length prefixes for variable-size fields
 */
class Serializer {
public:
  static std::vector<uint8_t> serialize(const ImmutableData &data);

  static std::vector<uint8_t> serialize(const MutableData &data);

  static std::vector<uint8_t> serialize(const AccountPacket &packet);

  /**
   * Serialize a client request; proxies reject requests whose serialized
   * form exceeds MAX_REQUEST_PAYLOAD_SIZE
   */
  static std::vector<uint8_t> serialize(const Request &request);

  /**
   * Deserialize an AccountPacket
   */
  static Result<AccountPacket>
  deserialize_account_packet(const std::vector<uint8_t> &data);

  // Helper methods for primitive types (public for use by other components)
  static void write_u8(std::vector<uint8_t> &buf, uint8_t val);
  static void write_u32(std::vector<uint8_t> &buf, uint32_t val);
  static void write_u64(std::vector<uint8_t> &buf, uint64_t val);
  static void write_bytes(std::vector<uint8_t> &buf,
                          const std::vector<uint8_t> &bytes);
  static void write_string(std::vector<uint8_t> &buf, const std::string &str);
  static void write_name(std::vector<uint8_t> &buf, const XorName &name);

  static void write_user(std::vector<uint8_t> &buf, const User &user);
  static void write_permission_set(std::vector<uint8_t> &buf,
                                   const PermissionSet &permissions);
  static void write_entry_actions(std::vector<uint8_t> &buf,
                                  const EntryActionMap &actions);

private:
  static uint8_t read_u8(const uint8_t *&ptr, const uint8_t *end);
  static uint32_t read_u32(const uint8_t *&ptr, const uint8_t *end);
  static uint64_t read_u64(const uint8_t *&ptr, const uint8_t *end);
  static std::vector<uint8_t> read_bytes(const uint8_t *&ptr,
                                         const uint8_t *end, size_t len);
};

} // namespace routing
} // namespace vaultsim
