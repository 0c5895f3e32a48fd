#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace rampart::schema::encoding {

// Encoders are selected at build time by tag. Hot swapping is not a design
// goal; the tag only keeps the wire library out of the schema headers.
template <typename Library>
struct encoder {
  template <typename T>
  std::string encode(const T& obj);

  template <typename T>
  void encode(const T& obj, std::string& out);

  template <typename T>
  T decode(std::string_view text);

  template <typename T>
  std::optional<T> try_decode(std::string_view text);
};

}  // namespace rampart::schema::encoding
