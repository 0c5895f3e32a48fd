#pragma once
#include <rampart/schema/policy_document.hpp>

#include <cstdint>

// Schema type: service role policy pair.
namespace rampart::schema {

template <uint16_t Version>
struct service_role_policy;

template <>
struct service_role_policy<1> final {
  uint16_t version{1};
  policy_document_t policy;
  policy_document_t assume_role_policy;

  bool operator==(const service_role_policy&) const = default;
};

using service_role_policy_t = service_role_policy<1>;

}  // namespace rampart::schema
