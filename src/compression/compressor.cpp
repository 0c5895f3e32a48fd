#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <rampart/compression/compressor.hpp>
#include <rampart/schema/encoding/json/encoder.hpp>
#include <rampart/schema/error_code.hpp>

#include <initializer_list>
#include <set>
#include <string>
#include <utility>

using namespace rampart::schema;

namespace {

using encoder_t = rampart::schema::encoding::encoder<
    rampart::schema::encoding::json_encoder_tag>;

constexpr auto kCodespace = "rampart.compress";

void stamp_version(policy_document_t& document) {
  if (document.policy_version.empty() && !document.statements.empty()) {
    document.policy_version = std::string{kPolicyDocumentVersion};
  }
}

policy_document_t make_packed_document() {
  auto document = policy_document_t{};
  document.policy_version = std::string{kPolicyDocumentVersion};
  return document;
}

// Greedy, order preserving. A statement that alone exceeds the size limit
// still gets its own document and is rejected by validation afterwards.
policy_documents_t pack(const policy_documents_t& documents,
                        const std::size_t max_document_size) {
  auto packed = policy_documents_t{};
  auto current = make_packed_document();
  auto sids = std::set<std::string>{};

  for (const auto& document : documents) {
    for (const auto& statement : document.statements) {
      auto sid_taken = !statement.sid.empty() && sids.contains(statement.sid);
      if (!current.statements.empty() && !sid_taken) {
        current.statements.push_back(statement);
        if (rampart::compression::encoded_size(current) <= max_document_size) {
          if (!statement.sid.empty()) {
            sids.insert(statement.sid);
          }
          continue;
        }
        current.statements.pop_back();
      }
      if (!current.statements.empty()) {
        packed.push_back(std::move(current));
        current = make_packed_document();
        sids.clear();
      }
      current.statements.push_back(statement);
      if (!statement.sid.empty()) {
        sids.insert(statement.sid);
      }
    }
  }
  if (!current.statements.empty()) {
    packed.push_back(std::move(current));
  }
  return packed;
}

operation_result_t compress_documents(const std::string& account_name,
                                      const char* list_name,
                                      policy_documents_t& documents,
                                      const bool pack_documents,
                                      const rampart::compression::limits& quotas) {
  for (auto& document : documents) {
    stamp_version(document);
  }

  if (pack_documents) {
    auto packed = pack(documents, quotas.max_document_size);
    spdlog::debug("Packed {} {} for account '{}' into {} document(s)",
                  documents.size(), list_name, account_name, packed.size());
    documents = std::move(packed);
  }

  for (std::size_t i = 0; i < documents.size(); ++i) {
    auto size = rampart::compression::encoded_size(documents[i]);
    if (size > quotas.max_document_size) {
      return make_error(error_code::policy_document_too_large,
                        std::string{list_name} + " document " +
                            std::to_string(i) + " for account '" +
                            account_name + "' is " + std::to_string(size) +
                            " bytes, limit is " +
                            std::to_string(quotas.max_document_size),
                        kCodespace);
    }
  }

  if (documents.size() > quotas.max_documents_per_account) {
    return make_error(error_code::too_many_policy_documents,
                      "account '" + account_name + "' needs " +
                          std::to_string(documents.size()) + " " + list_name +
                          " documents, limit is " +
                          std::to_string(quotas.max_documents_per_account),
                      kCodespace);
  }
  return {};
}

operation_result_t check_role_document(const std::string& account_name,
                                       const std::string& role_name,
                                       const char* what,
                                       const policy_document_t& document,
                                       const std::size_t limit) {
  auto size = rampart::compression::encoded_size(document);
  if (size <= limit) {
    return {};
  }
  return make_error(error_code::service_role_policy_too_large,
                    std::string{what} + " of service role '" + role_name +
                        "' for account '" + account_name + "' is " +
                        std::to_string(size) + " bytes, limit is " +
                        std::to_string(limit),
                    kCodespace);
}

// Both lists of an account are packed together so the role list stays a
// statement-wise prefix of the account list.
std::set<std::string> accounts_over_count(
    const policy_t& policy,
    const rampart::compression::limits& quotas) {
  auto out = std::set<std::string>{};
  for (const auto* lists :
       {&policy.account_policies, &policy.account_role_policies}) {
    for (const auto& [account_name, documents] : *lists) {
      if (documents.size() > quotas.max_documents_per_account) {
        out.insert(account_name);
      }
    }
  }
  return out;
}

operation_result_t compress_policy(policy_t& policy,
                                   const rampart::compression::limits& quotas) {
  const auto packed_accounts = accounts_over_count(policy, quotas);
  for (auto& [account_name, documents] : policy.account_policies) {
    auto result = compress_documents(account_name, "account policy", documents,
                                     packed_accounts.contains(account_name),
                                     quotas);
    if (result.code != 0) {
      return result;
    }
  }
  for (auto& [account_name, documents] : policy.account_role_policies) {
    auto result = compress_documents(account_name, "account role policy",
                                     documents,
                                     packed_accounts.contains(account_name),
                                     quotas);
    if (result.code != 0) {
      return result;
    }
  }
  for (auto& [account_name, roles] : policy.service_role_policies) {
    for (auto& [role_name, role_policy] : roles) {
      stamp_version(role_policy.policy);
      stamp_version(role_policy.assume_role_policy);
      auto result =
          check_role_document(account_name, role_name, "policy",
                              role_policy.policy, quotas.max_role_policy_size);
      if (result.code != 0) {
        return result;
      }
      result = check_role_document(account_name, role_name,
                                   "assume role policy",
                                   role_policy.assume_role_policy,
                                   quotas.max_assume_role_policy_size);
      if (result.code != 0) {
        return result;
      }
    }
  }
  return {};
}

}  // namespace

namespace rampart::compression {

std::size_t encoded_size(const schema::policy_document_t& document) {
  return encoder_t{}.encode(document).size();
}

schema::operation_result_t compress(schema::policy_t& policy,
                                    const limits& quotas) {
  try {
    return compress_policy(policy, quotas);
  } catch (const nlohmann::json::exception& ex) {
    // Raised by the encoder, e.g. for strings that are not valid UTF-8.
    return make_error(error_code::policy_document_unencodable,
                      std::string{"policy document cannot be encoded: "} +
                          ex.what(),
                      kCodespace);
  }
}

}  // namespace rampart::compression
