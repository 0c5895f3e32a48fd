#pragma once

#include <rampart/schema/operation_result.hpp>
#include <rampart/schema/policy.hpp>

#include <cstddef>

namespace rampart::compression {

/// Size quotas a composed policy must satisfy.
///
/// Defaults follow the cloud provider's IAM quotas: managed policy size,
/// managed policies per role, inline role policy size and trust policy size.
struct limits final {
  std::size_t max_document_size{6144};
  std::size_t max_documents_per_account{10};
  std::size_t max_role_policy_size{10240};
  std::size_t max_assume_role_policy_size{2048};
};

/// Minified JSON length of `document`, as counted against size quotas.
std::size_t encoded_size(const schema::policy_document_t& document);

/// Normalize and validate a composed policy in place.
///
/// Stamps the supported version on documents with statements, packs both
/// document lists of an account when either holds more than the document
/// limit, and rejects anything still over a quota or not encodable as JSON.
/// On failure `policy` may be partially rewritten.
schema::operation_result_t compress(schema::policy_t& policy,
                                    const limits& quotas);

}  // namespace rampart::compression
