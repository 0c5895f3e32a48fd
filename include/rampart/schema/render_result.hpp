#pragma once

#include <rampart/schema/error_code.hpp>
#include <rampart/schema/policy_document.hpp>

#include <cstdint>
#include <optional>
#include <string>

// Schema type: render result.
// `code == 0` with no document means the template deliberately produced
// nothing for this account; it is not a failure.
namespace rampart::schema {

template <uint16_t Version>
struct render_result;

template <>
struct render_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::optional<policy_document_t> document;
};

using render_result_t = render_result<1>;

}  // namespace rampart::schema
