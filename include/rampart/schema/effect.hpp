#pragma once

#include <rampart/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: statement effect.
namespace rampart::schema {

enum class effect_t : uint8_t { allow = 0, deny = 1 };

inline constexpr auto kEffectMappings = std::array{
    std::pair<std::string_view, effect_t>{"Allow", effect_t::allow},
    std::pair<std::string_view, effect_t>{"Deny", effect_t::deny},
};

template <>
inline std::optional<effect_t> try_from_string<effect_t>(
    const std::string_view value) {
  return from_string(value, kEffectMappings);
}

inline constexpr std::string_view to_string(const effect_t value) {
  return to_string(value, kEffectMappings).value_or("unknown");
}

}  // namespace rampart::schema
