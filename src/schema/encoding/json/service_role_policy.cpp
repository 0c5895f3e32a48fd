#include <rampart/schema/encoding/json/policy_document.hpp>
#include <rampart/schema/encoding/json/service_role_policy.hpp>

namespace rampart::schema::encoding::json {

void encode(const service_role_policy<1>& o, nlohmann::json& out) {
  out = nlohmann::json::object();
  encode(o.policy, out["policy"]);
  encode(o.assume_role_policy, out["assume_role_policy"]);
}

void decode(const nlohmann::json& in, service_role_policy<1>& o) {
  decode(in.at("policy"), o.policy);
  decode(in.at("assume_role_policy"), o.assume_role_policy);
}

}  // namespace rampart::schema::encoding::json
