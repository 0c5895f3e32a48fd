#include <rampart/schema/encoding/json/policy_statement.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

using namespace rampart::schema;

namespace {

constexpr auto kSid = "Sid";
constexpr auto kEffect = "Effect";
constexpr auto kAction = "Action";
constexpr auto kNotAction = "NotAction";
constexpr auto kResource = "Resource";
constexpr auto kNotResource = "NotResource";
constexpr auto kPrincipal = "Principal";
constexpr auto kCondition = "Condition";

// IAM accepts either a bare string or an array of strings for list fields.
string_list_t decode_string_list(const nlohmann::json& in,
                                 const std::string_view field) {
  if (in.is_string()) {
    return {in.get<std::string>()};
  }
  if (!in.is_array()) {
    throw std::invalid_argument{"field '" + std::string{field} +
                                "' must be a string or an array of strings"};
  }
  auto out = string_list_t{};
  out.reserve(in.size());
  for (const auto& item : in) {
    if (!item.is_string()) {
      throw std::invalid_argument{"field '" + std::string{field} +
                                  "' must only contain strings"};
    }
    out.push_back(item.get<std::string>());
  }
  return out;
}

// Condition values are frequently numbers or booleans; keep their JSON text.
std::string decode_condition_scalar(const nlohmann::json& in) {
  if (in.is_string()) {
    return in.get<std::string>();
  }
  if (in.is_number() || in.is_boolean()) {
    return in.dump();
  }
  throw std::invalid_argument{"condition values must be scalars"};
}

void decode_list_field(const nlohmann::json& in,
                       const char* field,
                       string_list_t& out) {
  if (auto it = in.find(field); it != std::end(in)) {
    out = decode_string_list(*it, field);
  }
}

principals_t decode_principals(const nlohmann::json& in) {
  if (in.is_string()) {
    if (in.get<std::string>() != kWildcard) {
      throw std::invalid_argument{"string principal must be '*'"};
    }
    return {{std::string{kWildcard}, {std::string{kWildcard}}}};
  }
  if (!in.is_object()) {
    throw std::invalid_argument{"field 'Principal' must be '*' or an object"};
  }
  auto out = principals_t{};
  for (const auto& [type, identifiers] : in.items()) {
    out[type] = decode_string_list(identifiers, kPrincipal);
  }
  return out;
}

conditions_t decode_conditions(const nlohmann::json& in) {
  if (!in.is_object()) {
    throw std::invalid_argument{"field 'Condition' must be an object"};
  }
  auto out = conditions_t{};
  for (const auto& [op, keys] : in.items()) {
    if (!keys.is_object()) {
      throw std::invalid_argument{"condition operator '" + op +
                                  "' must map to an object"};
    }
    auto& decoded_keys = out[op];
    for (const auto& [key, values] : keys.items()) {
      auto& decoded_values = decoded_keys[key];
      if (values.is_array()) {
        for (const auto& value : values) {
          decoded_values.push_back(decode_condition_scalar(value));
        }
      } else {
        decoded_values.push_back(decode_condition_scalar(values));
      }
    }
  }
  return out;
}

}  // namespace

namespace rampart::schema::encoding::json {

void encode(const policy_statement<1>& o, nlohmann::json& out) {
  out = nlohmann::json::object();
  if (!o.sid.empty()) {
    out[kSid] = o.sid;
  }
  out[kEffect] = std::string{to_string(o.effect)};
  if (!o.principals.empty()) {
    if (o.principals.size() == 1 && o.principals.begin()->first == kWildcard) {
      out[kPrincipal] = std::string{kWildcard};
    } else {
      out[kPrincipal] = o.principals;
    }
  }
  if (!o.actions.empty()) {
    out[kAction] = o.actions;
  }
  if (!o.not_actions.empty()) {
    out[kNotAction] = o.not_actions;
  }
  if (!o.resources.empty()) {
    out[kResource] = o.resources;
  }
  if (!o.not_resources.empty()) {
    out[kNotResource] = o.not_resources;
  }
  if (!o.conditions.empty()) {
    out[kCondition] = o.conditions;
  }
}

void decode(const nlohmann::json& in, policy_statement<1>& o) {
  if (!in.is_object()) {
    throw std::invalid_argument{"statement must be an object"};
  }
  if (auto it = in.find(kSid); it != std::end(in)) {
    o.sid = it->get<std::string>();
  }
  auto effect = in.at(kEffect).get<std::string>();
  auto parsed = try_from_string<effect_t>(effect);
  if (!parsed) {
    throw std::invalid_argument{"unsupported effect '" + effect +
                                "', expected " +
                                accepted_names(kEffectMappings)};
  }
  o.effect = *parsed;
  decode_list_field(in, kAction, o.actions);
  decode_list_field(in, kNotAction, o.not_actions);
  decode_list_field(in, kResource, o.resources);
  decode_list_field(in, kNotResource, o.not_resources);
  if (auto it = in.find(kPrincipal); it != std::end(in)) {
    o.principals = decode_principals(*it);
  }
  if (auto it = in.find(kCondition); it != std::end(in)) {
    o.conditions = decode_conditions(*it);
  }
}

}  // namespace rampart::schema::encoding::json
