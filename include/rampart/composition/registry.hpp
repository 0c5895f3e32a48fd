#pragma once

#include <rampart/composition/policy_template.hpp>
#include <rampart/schema/account.hpp>
#include <rampart/schema/operation_result.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace rampart::composition {

/// Process-wide store of policy templates and accounts.
///
/// One reader-writer lock guards both maps. Registration takes it
/// exclusively; attachment and composition on any container take it shared,
/// always before the container's own lock.
class registry final {
 public:
  registry() = default;

  registry(const registry&) = delete;
  registry& operator=(const registry&) = delete;

  /// Register an account by name; names are unique.
  schema::operation_result_t add_account(schema::account_t account);

  /// Register a template and bind it to this registry and `owner`.
  ///
  /// Fails on a duplicate key, or when the template is already bound.
  /// Failure leaves both the registry and the template untouched.
  schema::operation_result_t add_policy_template(
      std::shared_ptr<policy_template> candidate,
      const container& owner);

  std::size_t policy_template_count() const;
  std::size_t account_count() const;

  std::shared_ptr<const policy_template> find_policy_template(
      std::string_view key) const;
  std::shared_ptr<const schema::account_t> find_account(
      std::string_view name) const;

 private:
  friend class container;

  // Callers hold mutex_ in either mode.
  std::shared_ptr<const policy_template> find_policy_template_locked(
      std::string_view key) const;
  std::shared_ptr<const schema::account_t> find_account_locked(
      std::string_view name) const;

  mutable std::shared_mutex mutex_;
  std::map<std::string, std::shared_ptr<policy_template>, std::less<>>
      policy_templates_;
  std::map<std::string, std::shared_ptr<const schema::account_t>, std::less<>>
      accounts_;
};

}  // namespace rampart::composition
