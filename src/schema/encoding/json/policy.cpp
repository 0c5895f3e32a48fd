#include <rampart/schema/encoding/json/policy.hpp>
#include <rampart/schema/encoding/json/policy_document.hpp>
#include <rampart/schema/encoding/json/service_role_policy.hpp>

#include <string>

using namespace rampart::schema;

namespace {

constexpr auto kAccountPolicies = "account_policies";
constexpr auto kAccountRolePolicies = "account_role_policies";
constexpr auto kServiceRolePolicies = "service_role_policies";

nlohmann::json encode_account_documents(const account_documents_t& in) {
  auto out = nlohmann::json::object();
  for (const auto& [account_name, documents] : in) {
    auto& encoded = out[account_name];
    encoded = nlohmann::json::array();
    for (const auto& document : documents) {
      auto item = nlohmann::json{};
      rampart::schema::encoding::json::encode(document, item);
      encoded.push_back(std::move(item));
    }
  }
  return out;
}

account_documents_t decode_account_documents(const nlohmann::json& in) {
  auto out = account_documents_t{};
  for (const auto& [account_name, documents] : in.items()) {
    auto& decoded = out[account_name];
    for (const auto& item : documents) {
      auto document = policy_document_t{};
      rampart::schema::encoding::json::decode(item, document);
      decoded.push_back(std::move(document));
    }
  }
  return out;
}

}  // namespace

namespace rampart::schema::encoding::json {

void encode(const policy<1>& o, nlohmann::json& out) {
  out = nlohmann::json::object();
  out[kAccountPolicies] = encode_account_documents(o.account_policies);
  out[kAccountRolePolicies] = encode_account_documents(o.account_role_policies);
  auto& service_roles = out[kServiceRolePolicies];
  service_roles = nlohmann::json::object();
  for (const auto& [account_name, roles] : o.service_role_policies) {
    auto& encoded_roles = service_roles[account_name];
    encoded_roles = nlohmann::json::object();
    for (const auto& [role_name, role_policy] : roles) {
      encode(role_policy, encoded_roles[role_name]);
    }
  }
}

void decode(const nlohmann::json& in, policy<1>& o) {
  o.account_policies = decode_account_documents(in.at(kAccountPolicies));
  o.account_role_policies =
      decode_account_documents(in.at(kAccountRolePolicies));
  for (const auto& [account_name, roles] :
       in.at(kServiceRolePolicies).items()) {
    auto& decoded_roles = o.service_role_policies[account_name];
    for (const auto& [role_name, role_policy] : roles.items()) {
      decode(role_policy, decoded_roles[role_name]);
    }
  }
}

}  // namespace rampart::schema::encoding::json
