#pragma once

#include "harness/contract_violation.h"
#include "routing/messages.h"
#include <optional>
#include <string>

namespace vaultsim {
namespace harness {

using namespace vaultsim::common;

/// What a Terminated event means while waiting for a response
enum class TerminationPolicy {
  Fatal,           ///< contract violation
  InvalidOperation ///< the request was expected to get the client disconnected
};

/**
 * Correlated - Result of a response together with the authority that sent it
 */
template <typename Kind> struct Correlated {
  decltype(Kind::res) res;
  routing::Authority src;
};

/**
 * Match `event` against the response of kind `Kind` to request `msg_id`
 *
 * A response carrying another message id is a correlation mismatch. Any
 * other event, or no event at all, is a contract violation, except that a
 * Terminated event yields an InvalidOperation failure under
 * TerminationPolicy::InvalidOperation.
 */
template <typename Kind>
Correlated<Kind> correlate(const std::optional<routing::Event> &event,
                           const routing::MessageId &msg_id,
                           TerminationPolicy policy = TerminationPolicy::Fatal) {
  using Res = decltype(Kind::res);

  if (!event) {
    contract_violation(std::string("No event while expecting ") + Kind::NAME +
                           " response",
                       {{"msg_id", msg_id.to_string()}});
  }

  if (auto *received = std::get_if<routing::event::Response>(&*event)) {
    routing::MessageId received_id = routing::response_msg_id(received->response);
    if (received_id != msg_id) {
      contract_violation("Correlation mismatch",
                         {{"expected_kind", Kind::NAME},
                          {"expected_msg_id", msg_id.to_string()},
                          {"event", routing::describe(*event)}});
    }
    if (auto *typed = std::get_if<Kind>(&received->response)) {
      return Correlated<Kind>{typed->res, received->src};
    }
  } else if (std::holds_alternative<routing::event::Terminated>(*event) &&
             policy == TerminationPolicy::InvalidOperation) {
    return Correlated<Kind>{
        Res::failure(routing::ClientError::Kind::InvalidOperation),
        routing::Authority()};
  }

  contract_violation("Unexpected event",
                     {{"expected_kind", Kind::NAME},
                      {"expected_msg_id", msg_id.to_string()},
                      {"event", routing::describe(*event)}});
}

/**
 * correlate() without the source authority
 */
template <typename Kind>
decltype(Kind::res)
expect_response(const std::optional<routing::Event> &event,
                const routing::MessageId &msg_id,
                TerminationPolicy policy = TerminationPolicy::Fatal) {
  return correlate<Kind>(event, msg_id, policy).res;
}

} // namespace harness
} // namespace vaultsim
