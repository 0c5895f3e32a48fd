#pragma once
#include <rampart/schema/effect.hpp>
#include <rampart/schema/primitives.hpp>

#include <cstdint>
#include <string>

// Schema type: policy statement.
// One grant or denial inside a policy document. A statement names either
// `actions` or `not_actions`, and either `resources` or `not_resources`.
namespace rampart::schema {

template <uint16_t Version>
struct policy_statement;

template <>
struct policy_statement<1> final {
  uint16_t version{1};
  std::string sid;
  effect_t effect{effect_t::allow};
  string_list_t actions;
  string_list_t not_actions;
  string_list_t resources;
  string_list_t not_resources;
  principals_t principals;  // trust policies only
  conditions_t conditions;

  bool operator==(const policy_statement&) const = default;
};

using policy_statement_t = policy_statement<1>;

}  // namespace rampart::schema
