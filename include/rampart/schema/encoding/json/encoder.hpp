#pragma once
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <rampart/common/critical.hpp>
#include <rampart/schema/encoding/encoder.hpp>
#include <rampart/schema/encoding/json/account.hpp>
#include <rampart/schema/encoding/json/policy.hpp>
#include <rampart/schema/encoding/json/policy_document.hpp>
#include <rampart/schema/encoding/json/policy_statement.hpp>
#include <rampart/schema/encoding/json/service_role_policy.hpp>

#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace rampart::schema::encoding {

struct json_encoder_tag {};

/// IAM-style JSON encoding of the policy model.
///
/// `encode` produces minified text; its length is what cloud providers count
/// against policy size quotas.
template <>
struct encoder<json_encoder_tag> final {
  template <typename T>
  std::string encode(const T& obj);

  template <typename T>
  void encode(const T& obj, std::string& out);

  template <typename T>
  nlohmann::json to_json(const T& obj);

  template <typename T>
  T decode(std::string_view text);

  template <typename T>
  std::optional<T> try_decode(std::string_view text);

  /// As `try_decode`, reporting the parse or shape error in `error`.
  template <typename T>
  std::optional<T> try_decode(std::string_view text, std::string& error);

  template <typename T>
  std::optional<T> try_from_json(const nlohmann::json& in, std::string& error);
};

template <typename T>
std::string encoder<json_encoder_tag>::encode(const T& obj) {
  return to_json(obj).dump();
}

template <typename T>
void encoder<json_encoder_tag>::encode(const T& obj, std::string& out) {
  out.append(encode(obj));
}

template <typename T>
nlohmann::json encoder<json_encoder_tag>::to_json(const T& obj) {
  auto out = nlohmann::json{};
  json::encode(obj, out);
  return out;
}

template <typename T>
T encoder<json_encoder_tag>::decode(std::string_view text) {
  auto error = std::string{};
  auto decoded = try_decode<T>(text, error);
  if (!decoded) {
    rampart::common::critical("failed to decode JSON document: {}", error);
  }
  return std::move(decoded.value());
}

template <typename T>
std::optional<T> encoder<json_encoder_tag>::try_decode(std::string_view text) {
  auto error = std::string{};
  return try_decode<T>(text, error);
}

template <typename T>
std::optional<T> encoder<json_encoder_tag>::try_decode(std::string_view text,
                                                       std::string& error) {
  auto parsed = nlohmann::json::parse(text, nullptr, false);
  if (parsed.is_discarded()) {
    error = "malformed JSON";
    return std::nullopt;
  }
  return try_from_json<T>(parsed, error);
}

template <typename T>
std::optional<T> encoder<json_encoder_tag>::try_from_json(
    const nlohmann::json& in,
    std::string& error) {
  try {
    auto out = T{};
    json::decode(in, out);
    return out;
  } catch (const std::exception& ex) {
    error = ex.what();
    spdlog::debug("JSON decode rejected input: {}", error);
    return std::nullopt;
  }
}

}  // namespace rampart::schema::encoding
