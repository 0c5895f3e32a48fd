#include <spdlog/spdlog.h>
#include <rampart/common/critical.hpp>
#include <rampart/composition/container.hpp>
#include <rampart/composition/registry.hpp>

#include <mutex>
#include <utility>

using namespace rampart::schema;

namespace {

constexpr auto kCodespace = "rampart.registry";

}  // namespace

namespace rampart::composition {

schema::operation_result_t registry::add_account(schema::account_t account) {
  auto lock = std::unique_lock{mutex_};
  if (accounts_.contains(account.name)) {
    return make_error(error_code::account_exists,
                      "account '" + account.name + "' already exists",
                      kCodespace);
  }
  spdlog::debug("Registered account '{}' ({})", account.name, account.id);
  auto name = account.name;
  accounts_.emplace(std::move(name), std::make_shared<const schema::account_t>(
                                         std::move(account)));
  return {};
}

schema::operation_result_t registry::add_policy_template(
    std::shared_ptr<policy_template> candidate,
    const container& owner) {
  if (!candidate) {
    rampart::common::critical("cannot register a null policy template");
  }
  auto lock = std::unique_lock{mutex_};
  if (policy_templates_.contains(candidate->key())) {
    return make_error(error_code::policy_template_exists,
                      "policy template '" + candidate->key() +
                          "' already exists",
                      kCodespace);
  }
  if (!candidate->try_bind(
          template_binding{.owner = this, .container_id = owner.id()})) {
    return make_error(error_code::policy_template_bound,
                      "policy template '" + candidate->key() +
                          "' is already bound to a registry",
                      kCodespace);
  }

  spdlog::debug("Registered policy template '{}' owned by container '{}'",
                candidate->key(), owner.id());
  auto key = candidate->key();
  policy_templates_.emplace(std::move(key), std::move(candidate));
  return {};
}

std::size_t registry::policy_template_count() const {
  auto lock = std::shared_lock{mutex_};
  return policy_templates_.size();
}

std::size_t registry::account_count() const {
  auto lock = std::shared_lock{mutex_};
  return accounts_.size();
}

std::shared_ptr<const policy_template> registry::find_policy_template(
    std::string_view key) const {
  auto lock = std::shared_lock{mutex_};
  return find_policy_template_locked(key);
}

std::shared_ptr<const schema::account_t> registry::find_account(
    std::string_view name) const {
  auto lock = std::shared_lock{mutex_};
  return find_account_locked(name);
}

std::shared_ptr<const policy_template> registry::find_policy_template_locked(
    std::string_view key) const {
  auto it = policy_templates_.find(key);
  if (it == std::end(policy_templates_)) {
    return nullptr;
  }
  return it->second;
}

std::shared_ptr<const schema::account_t> registry::find_account_locked(
    std::string_view name) const {
  auto it = accounts_.find(name);
  if (it == std::end(accounts_)) {
    return nullptr;
  }
  return it->second;
}

}  // namespace rampart::composition
