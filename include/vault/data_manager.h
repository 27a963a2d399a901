#pragma once

#include "routing/messages.h"
#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace vaultsim {
namespace vault {

using namespace vaultsim::common;

/**
 * DataManager - Chunk store for the data names this node is closest to
 *
 * Serves reads from any source and applies mutations forwarded by client
 * managers, replying to whoever sent the request.
 */
class DataManager {
public:
  std::vector<routing::RoutingMessage>
  handle_request(const routing::Authority &src, const routing::Authority &dst,
                 const routing::Request &request);

  std::optional<routing::ImmutableData> idata(const XorName &name) const;
  std::optional<routing::MutableData> mdata(const XorName &name,
                                            uint64_t tag) const;

  size_t idata_count() const { return idata_.size(); }
  size_t mdata_count() const { return mdata_.size(); }

private:
  using MDataKey = std::pair<XorName, uint64_t>;

  routing::Response handle_read(const routing::Request &request) const;
  routing::Response handle_mutation(const routing::Authority &src,
                                    const routing::Request &request);

  routing::ClientResult<routing::MutableData *> find_mdata(const XorName &name,
                                                           uint64_t tag);
  routing::ClientResult<const routing::MutableData *>
  find_mdata(const XorName &name, uint64_t tag) const;

  std::map<XorName, routing::ImmutableData> idata_;
  std::map<MDataKey, routing::MutableData> mdata_;
};

} // namespace vault
} // namespace vaultsim
