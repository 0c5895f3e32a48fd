#pragma once
#include <rampart/schema/policy_statement.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Schema type: policy document.
// An ordered statement list plus the policy language version it declares.
// A document with no statements is the placeholder emitted for templates
// that rendered nothing.
namespace rampart::schema {

/// The only policy language version rendered documents may declare.
inline constexpr auto kPolicyDocumentVersion = std::string_view{"2012-10-17"};

template <uint16_t Version>
struct policy_document;

template <>
struct policy_document<1> final {
  uint16_t version{1};
  std::string policy_version;  // empty when the document did not declare one
  std::vector<policy_statement_t> statements;

  bool operator==(const policy_document&) const = default;
};

using policy_document_t = policy_document<1>;

}  // namespace rampart::schema
