#pragma once
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace rampart::schema {

using string_list_t = std::vector<std::string>;

// Attachment-time variable bindings, keyed by variable name.
using variables_t = std::map<std::string, std::string>;

// Service identifiers a template may grant, e.g. "s3:*" or "ec2:Describe*".
using scope_t = std::vector<std::string>;

// Principal type ("AWS", "Service", "Federated", "*") -> identifiers.
using principals_t = std::map<std::string, string_list_t>;

// Condition operator -> condition key -> values.
using conditions_t =
    std::map<std::string, std::map<std::string, string_list_t>>;

inline constexpr auto kWildcard = std::string_view{"*"};

}  // namespace rampart::schema
