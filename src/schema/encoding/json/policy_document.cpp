#include <rampart/schema/encoding/json/policy_document.hpp>
#include <rampart/schema/encoding/json/policy_statement.hpp>

#include <stdexcept>
#include <string>

using namespace rampart::schema;

namespace {

constexpr auto kVersion = "Version";
constexpr auto kStatement = "Statement";

}  // namespace

namespace rampart::schema::encoding::json {

void encode(const policy_document<1>& o, nlohmann::json& out) {
  out = nlohmann::json::object();
  if (!o.policy_version.empty()) {
    out[kVersion] = o.policy_version;
  }
  auto statements = nlohmann::json::array();
  for (const auto& statement : o.statements) {
    auto encoded = nlohmann::json{};
    encode(statement, encoded);
    statements.push_back(std::move(encoded));
  }
  out[kStatement] = std::move(statements);
}

void decode(const nlohmann::json& in, policy_document<1>& o) {
  if (!in.is_object()) {
    throw std::invalid_argument{"policy document must be an object"};
  }
  if (auto it = in.find(kVersion); it != std::end(in)) {
    o.policy_version = it->get<std::string>();
  }
  auto it = in.find(kStatement);
  if (it == std::end(in)) {
    return;
  }
  // A single statement may be written without the enclosing array.
  if (it->is_object()) {
    auto statement = policy_statement_t{};
    decode(*it, statement);
    o.statements.push_back(std::move(statement));
    return;
  }
  if (!it->is_array()) {
    throw std::invalid_argument{
        "field 'Statement' must be an object or an array"};
  }
  o.statements.reserve(it->size());
  for (const auto& item : *it) {
    auto statement = policy_statement_t{};
    decode(item, statement);
    o.statements.push_back(std::move(statement));
  }
}

}  // namespace rampart::schema::encoding::json
