#pragma once

#include <cstdint>

namespace rampart::schema {

enum class error_code : uint32_t {
  policy_template_exists = 1,
  policy_template_bound = 2,
  policy_template_missing = 3,
  account_exists = 4,
  account_missing = 5,
  variable_missing = 6,
  render_failed = 10,
  unsupported_policy_version = 11,
  policy_document_too_large = 20,
  too_many_policy_documents = 21,
  service_role_policy_too_large = 22,
  policy_document_unencodable = 23,
  invalid_manifest = 30,
};

inline constexpr uint32_t to_code(const error_code value) {
  return static_cast<uint32_t>(value);
}

}  // namespace rampart::schema
