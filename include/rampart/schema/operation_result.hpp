#pragma once

#include <rampart/schema/error_code.hpp>

#include <cstdint>
#include <string>
#include <utility>

// Schema type: operation result.
// Outcome of a registration or compression step. `code` is 0 on success,
// otherwise an `error_code` value; `codespace` names the failing subsystem.
namespace rampart::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
};

using operation_result_t = operation_result<1>;

inline operation_result_t make_error(const error_code code,
                                     std::string log,
                                     std::string codespace) {
  auto result = operation_result_t{};
  result.code = to_code(code);
  result.log = std::move(log);
  result.codespace = std::move(codespace);
  return result;
}

}  // namespace rampart::schema
