#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <rampart/composition/container.hpp>
#include <rampart/composition/document_template.hpp>
#include <rampart/schema/encoding/json/encoder.hpp>
#include <rampart/schema/error_code.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

using namespace rampart::schema;

namespace {

using encoder_t = rampart::schema::encoding::encoder<
    rampart::schema::encoding::json_encoder_tag>;

constexpr auto kPlaceholderOpen = std::string_view{"${"};
constexpr auto kPlaceholderClose = '}';

// JSON string content of `value`, without the surrounding quotes.
std::string escape_json(const std::string& value) {
  auto quoted = nlohmann::json(value).dump(
      -1, ' ', false, nlohmann::json::error_handler_t::replace);
  return quoted.substr(1, quoted.size() - 2);
}

std::optional<std::string> resolve_placeholder(
    const std::string_view name,
    const rampart::composition::container& owner,
    const account_t& account,
    const variables_t& variables) {
  if (name == "account.name") {
    return account.name;
  }
  if (name == "account.id") {
    return account.id;
  }
  if (name == "container.id") {
    return owner.id();
  }
  if (auto it = variables.find(std::string{name}); it != std::end(variables)) {
    return it->second;
  }
  return std::nullopt;
}

render_result_t render_error(std::string log) {
  auto result = render_result_t{};
  result.code = to_code(error_code::render_failed);
  result.log = std::move(log);
  return result;
}

}  // namespace

namespace rampart::composition {

document_template::document_template(
    std::string key,
    schema::string_list_t variables,
    schema::scope_t scope,
    document_sources sources,
    std::optional<schema::service_role_t> service_role)
    : policy_template{std::move(key), std::move(variables), std::move(scope),
                      std::move(service_role)},
      sources_{std::move(sources)} {}

schema::render_result_t document_template::render(
    const container& owner,
    const schema::account_t& account,
    const schema::variables_t& variables) const {
  return render_source(sources_.document, "policy", owner, account, variables);
}

schema::render_result_t document_template::render_service_role(
    const container& owner,
    const schema::account_t& account,
    const schema::variables_t& variables) const {
  return render_source(sources_.service_role_policy, "service role policy",
                       owner, account, variables);
}

schema::render_result_t document_template::render_service_assume_role(
    const container& owner,
    const schema::account_t& account,
    const schema::variables_t& variables) const {
  return render_source(sources_.service_assume_role_policy,
                       "service assume role policy", owner, account,
                       variables);
}

schema::render_result_t document_template::render_source(
    const std::optional<std::string>& source,
    const std::string_view what,
    const container& owner,
    const schema::account_t& account,
    const schema::variables_t& variables) const {
  if (!source) {
    spdlog::debug("Template '{}' has no {} for account '{}'", key(), what,
                  account.name);
    return {};
  }

  auto text = std::string{};
  text.reserve(source->size());
  auto cursor = std::size_t{0};
  while (cursor < source->size()) {
    auto open = source->find(kPlaceholderOpen, cursor);
    if (open == std::string::npos) {
      text.append(*source, cursor, std::string::npos);
      break;
    }
    text.append(*source, cursor, open - cursor);
    auto name_begin = open + kPlaceholderOpen.size();
    auto close = source->find(kPlaceholderClose, name_begin);
    if (close == std::string::npos) {
      return render_error("unterminated placeholder in " + std::string{what} +
                          " of template '" + key() + "'");
    }
    auto name = std::string_view{*source}.substr(name_begin, close - name_begin);
    auto value = resolve_placeholder(name, owner, account, variables);
    if (!value) {
      return render_error("undefined variable '" + std::string{name} +
                          "' in " + std::string{what} + " of template '" +
                          key() + "'");
    }
    text.append(escape_json(*value));
    cursor = close + 1;
  }

  auto error = std::string{};
  auto document = encoder_t{}.try_decode<schema::policy_document_t>(text, error);
  if (!document) {
    return render_error("invalid " + std::string{what} + " in template '" +
                        key() + "' for account '" + account.name +
                        "': " + error);
  }

  auto result = schema::render_result_t{};
  result.document = std::move(document);
  return result;
}

}  // namespace rampart::composition
