#pragma once

#include <cstdint>
#include <string>

// Schema type: service role descriptor.
// A secondary role a template provisions next to its account policy, with
// its own permissions policy and trust (assume-role) policy.
namespace rampart::schema {

template <uint16_t Version>
struct service_role;

template <>
struct service_role<1> final {
  uint16_t version{1};
  std::string name;

  bool operator==(const service_role&) const = default;
};

using service_role_t = service_role<1>;

}  // namespace rampart::schema
