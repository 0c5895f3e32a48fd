#pragma once

#include <cstdint>
#include <string>

// Schema type: cloud account.
// Registered by name before any attachment may reference it.
namespace rampart::schema {

template <uint16_t Version>
struct account;

template <>
struct account<1> final {
  uint16_t version{1};
  std::string name;
  std::string id;  // provider account number

  bool operator==(const account&) const = default;
};

using account_t = account<1>;

}  // namespace rampart::schema
