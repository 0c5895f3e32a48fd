#pragma once

#include <rampart/schema/account.hpp>
#include <rampart/schema/primitives.hpp>
#include <rampart/schema/render_result.hpp>
#include <rampart/schema/service_role.hpp>

#include <mutex>
#include <optional>
#include <string>

namespace rampart::composition {

class container;
class registry;

/// Ownership stamp written exactly once, when a template is registered.
struct template_binding final {
  const registry* owner{};
  std::string container_id;
};

/// A named, parameterized unit that renders policy documents.
///
/// The base class carries the attributes composition reads (required
/// variables, scope, optional service role) and the registration binding;
/// subclasses provide rendering. A template can be registered once, with one
/// registry and one owning container, for its whole lifetime.
class policy_template {
 public:
  policy_template(std::string key,
                  schema::string_list_t variables,
                  schema::scope_t scope,
                  std::optional<schema::service_role_t> service_role =
                      std::nullopt);
  virtual ~policy_template() = default;

  policy_template(const policy_template&) = delete;
  policy_template& operator=(const policy_template&) = delete;

  const std::string& key() const { return key_; }

  /// Variable names every attachment must bind.
  const schema::string_list_t& variables() const { return variables_; }

  /// Service identifiers this template may grant; drives default-deny.
  const schema::scope_t& scope() const { return scope_; }

  const std::optional<schema::service_role_t>& service_role() const {
    return service_role_;
  }

  /// Set by registration; empty while unregistered.
  std::optional<template_binding> binding() const;

  /// Render the account policy document.
  ///
  /// A successful result without a document means the template produces
  /// nothing for this account.
  virtual schema::render_result_t render(
      const container& owner,
      const schema::account_t& account,
      const schema::variables_t& variables) const = 0;

  /// Render the permissions policy of the declared service role.
  virtual schema::render_result_t render_service_role(
      const container& owner,
      const schema::account_t& account,
      const schema::variables_t& variables) const = 0;

  /// Render the trust policy of the declared service role.
  virtual schema::render_result_t render_service_assume_role(
      const container& owner,
      const schema::account_t& account,
      const schema::variables_t& variables) const = 0;

 private:
  friend class registry;

  // Stamps `binding` unless one is already set. Registries do not share a
  // lock, so the claim is guarded by the template itself.
  bool try_bind(template_binding binding);

  std::string key_;
  schema::string_list_t variables_;
  schema::scope_t scope_;
  std::optional<schema::service_role_t> service_role_;
  mutable std::mutex binding_mutex_;
  std::optional<template_binding> binding_;
};

}  // namespace rampart::composition
