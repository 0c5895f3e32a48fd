#pragma once
#include <rampart/schema/policy_document.hpp>
#include <rampart/schema/service_role_policy.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

// Schema type: composed policy.
// Output of container composition, keyed by account name. For every
// account, `account_role_policies` holds the same documents as
// `account_policies` except the trailing allow-all document.
namespace rampart::schema {

using policy_documents_t = std::vector<policy_document_t>;
using account_documents_t = std::map<std::string, policy_documents_t>;
using service_role_policies_t =
    std::map<std::string, std::map<std::string, service_role_policy_t>>;

template <uint16_t Version>
struct policy;

template <>
struct policy<1> final {
  uint16_t version{1};
  account_documents_t account_policies;
  account_documents_t account_role_policies;
  service_role_policies_t service_role_policies;

  bool operator==(const policy&) const = default;
};

using policy_t = policy<1>;

}  // namespace rampart::schema
