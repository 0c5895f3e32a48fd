#pragma once

#include <rampart/composition/policy_template.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace rampart::composition {

/// JSON bodies of a `document_template`. A missing body renders nothing.
struct document_sources final {
  std::optional<std::string> document;
  std::optional<std::string> service_role_policy;
  std::optional<std::string> service_assume_role_policy;
};

/// Template whose documents are JSON text with `${name}` placeholders.
///
/// Placeholders resolve to `account.name`, `account.id`, `container.id`, or
/// an attachment variable of the same name. Values are escaped as JSON string
/// content, so placeholders belong inside string literals.
class document_template final : public policy_template {
 public:
  document_template(std::string key,
                    schema::string_list_t variables,
                    schema::scope_t scope,
                    document_sources sources,
                    std::optional<schema::service_role_t> service_role =
                        std::nullopt);

  schema::render_result_t render(
      const container& owner,
      const schema::account_t& account,
      const schema::variables_t& variables) const override;

  schema::render_result_t render_service_role(
      const container& owner,
      const schema::account_t& account,
      const schema::variables_t& variables) const override;

  schema::render_result_t render_service_assume_role(
      const container& owner,
      const schema::account_t& account,
      const schema::variables_t& variables) const override;

 private:
  schema::render_result_t render_source(
      const std::optional<std::string>& source,
      std::string_view what,
      const container& owner,
      const schema::account_t& account,
      const schema::variables_t& variables) const;

  document_sources sources_;
};

}  // namespace rampart::composition
