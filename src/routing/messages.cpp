#include "routing/messages.h"
#include <sstream>
#include <type_traits>

namespace vaultsim {
namespace routing {

MessageId MessageId::random(SeededRng &rng) {
  MessageId msg_id;
  msg_id.id = rng.gen_name();
  return msg_id;
}

const char *Request::name() const {
  return std::visit(
      [](const auto &body) -> const char * {
        using Req = std::decay_t<decltype(body)>;
        return ResponseFor<Req>::type::NAME;
      },
      body);
}

bool Request::is_mutation() const {
  return std::holds_alternative<request::PutIData>(body) ||
         std::holds_alternative<request::PutMData>(body) ||
         std::holds_alternative<request::MutateMDataEntries>(body) ||
         std::holds_alternative<request::SetMDataUserPermissions>(body) ||
         std::holds_alternative<request::DelMDataUserPermissions>(body) ||
         std::holds_alternative<request::ChangeMDataOwner>(body);
}

MessageId response_msg_id(const Response &response) {
  return std::visit([](const auto &resp) { return resp.msg_id; }, response);
}

std::string describe(const Response &response) {
  return std::visit(
      [](const auto &resp) {
        std::ostringstream oss;
        oss << resp.NAME << " { msg_id: " << resp.msg_id.to_string()
            << ", res: ";
        if (resp.res.is_ok()) {
          oss << "Ok";
        } else {
          oss << "Err(" << resp.res.error().to_string() << ")";
        }
        oss << " }";
        return oss.str();
      },
      response);
}

Response error_response(const Request &request, const ClientError &error) {
  return std::visit(
      [&](const auto &body) -> Response {
        using Resp = typename ResponseFor<std::decay_t<decltype(body)>>::type;
        using Res = decltype(Resp::res);
        return Resp{Res::failure(error), request.msg_id};
      },
      request.body);
}

std::string describe(const Event &event) {
  if (std::holds_alternative<event::Connected>(event)) {
    return "Connected";
  }
  if (std::holds_alternative<event::Terminated>(event)) {
    return "Terminated";
  }
  const auto &resp = std::get<event::Response>(event);
  return "Response { response: " + describe(resp.response) +
         ", src: " + resp.src.to_string() + ", dst: " + resp.dst.to_string() +
         " }";
}

Bytes bootstrap_challenge(const crypto::PublicKeys &keys) {
  const std::string prefix = "vaultsim-bootstrap:";
  Bytes challenge(prefix.begin(), prefix.end());
  const auto &key = keys.public_sign_key();
  challenge.insert(challenge.end(), key.begin(), key.end());
  return challenge;
}

} // namespace routing
} // namespace vaultsim
