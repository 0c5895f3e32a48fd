#include <spdlog/spdlog.h>
#include <rampart/composition/container.hpp>
#include <rampart/schema/error_code.hpp>

#include <algorithm>
#include <iterator>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <utility>

using namespace rampart::schema;

namespace {

constexpr auto kAttachCodespace = "rampart.attach";
constexpr auto kComposeCodespace = "rampart.compose";
constexpr auto kRenderCodespace = "rampart.render";

// Acquires the registry lock (always shared) before the container lock.
// Members are constructed in declaration order and released in reverse.
template <typename ContainerLock>
struct ordered_lock final {
  ordered_lock(std::shared_mutex& registry_mutex,
               std::shared_mutex& container_mutex)
      : registry_lock{registry_mutex}, container_lock{container_mutex} {}

  std::shared_lock<std::shared_mutex> registry_lock;
  ContainerLock container_lock;
};

using attach_lock_t = ordered_lock<std::unique_lock<std::shared_mutex>>;
using compose_lock_t = ordered_lock<std::shared_lock<std::shared_mutex>>;

rampart::composition::attach_result attach_error(const error_code code,
                                                 std::string log) {
  auto result = rampart::composition::attach_result{};
  result.code = to_code(code);
  result.log = std::move(log);
  result.codespace = kAttachCodespace;
  return result;
}

rampart::composition::compose_result compose_error(const uint32_t code,
                                                   std::string log,
                                                   const char* codespace) {
  auto result = rampart::composition::compose_result{};
  result.code = code;
  result.log = std::move(log);
  result.codespace = codespace;
  return result;
}

policy_document_t make_document(policy_statement_t statement) {
  auto document = policy_document_t{};
  document.statements.push_back(std::move(statement));
  return document;
}

policy_statement_t make_allow_all() {
  auto statement = policy_statement_t{};
  statement.sid = "AllowAll";
  statement.effect = effect_t::allow;
  statement.actions = {std::string{kWildcard}};
  statement.resources = {std::string{kWildcard}};
  return statement;
}

policy_statement_t make_deny_all() {
  auto statement = policy_statement_t{};
  statement.sid = "DenyAll";
  statement.effect = effect_t::deny;
  statement.actions = {std::string{kWildcard}};
  statement.resources = {std::string{kWildcard}};
  return statement;
}

policy_statement_t make_deny_unknown_services(
    const std::unordered_set<std::string>& scope) {
  // Emitted order must not depend on hash iteration order.
  auto not_actions = string_list_t(std::begin(scope), std::end(scope));
  std::ranges::sort(not_actions);

  auto statement = policy_statement_t{};
  statement.sid = "DenyUnknownServices";
  statement.effect = effect_t::deny;
  statement.not_actions = std::move(not_actions);
  statement.resources = {std::string{kWildcard}};
  return statement;
}

}  // namespace

namespace rampart::composition {

container::container(registry& owner, std::string id)
    : registry_{owner}, id_{std::move(id)} {}

schema::operation_result_t container::add_policy_template(
    std::shared_ptr<policy_template> candidate) {
  return registry_.add_policy_template(std::move(candidate), *this);
}

attach_result container::add_attachment(std::string_view template_key,
                                         std::string_view account_name,
                                         schema::variables_t variables) {
  auto lock = attach_lock_t{registry_.mutex_, mutex_};

  auto source = registry_.find_policy_template_locked(template_key);
  if (!source) {
    return attach_error(error_code::policy_template_missing,
                        "cannot add attachment, unknown policy template '" +
                            std::string{template_key} + "' in container '" +
                            id_ + "'");
  }

  auto account = registry_.find_account_locked(account_name);
  if (!account) {
    return attach_error(error_code::account_missing,
                        "cannot add attachment, unknown account '" +
                            std::string{account_name} + "' in container '" +
                            id_ + "'");
  }

  for (const auto& name : source->variables()) {
    if (!variables.contains(name)) {
      return attach_error(error_code::variable_missing,
                          "cannot add attachment, variable '" + name +
                              "' is not set in container '" + id_ + "'");
    }
  }

  auto created = std::make_shared<const attachment>(
      std::move(source), std::move(account), std::move(variables));
  attachments_.push_back(created);
  spdlog::debug("Container '{}' attached {}", id_, created->to_string());

  auto result = attach_result{};
  result.attached = std::move(created);
  return result;
}

compose_result container::policy(const compression::limits& limits) const {
  auto lock = compose_lock_t{registry_.mutex_, mutex_};

  auto account_policies = schema::account_documents_t{};
  auto account_role_policies = schema::account_documents_t{};
  auto service_role_policies = schema::service_role_policies_t{};
  // Account name -> union of scope of every template rendered for it. An
  // account present with an empty set was attached but granted nothing.
  auto scopes = std::map<std::string, std::unordered_set<std::string>>{};
  auto missing = std::vector<std::shared_ptr<const attachment>>{};

  for (const auto& entry : attachments_) {
    const auto& source = entry->source_template();
    const auto& account = entry->account();
    service_role_policies.try_emplace(account.name);

    auto rendered = source.render(*this, account, entry->variables());
    if (rendered.code != 0) {
      spdlog::error("Container '{}' failed rendering {}: {}", id_,
                    entry->to_string(), rendered.log);
      return compose_error(rendered.code, std::move(rendered.log),
                           kRenderCodespace);
    }

    auto& scope = scopes[account.name];

    if (!rendered.document) {
      spdlog::warn("Policy template '{}' rendered no document for account '{}'",
                   source.key(), account.name);
      account_policies[account.name].push_back(schema::policy_document_t{});
      missing.push_back(entry);
      continue;
    }

    auto& document = *rendered.document;
    if (!document.policy_version.empty() &&
        document.policy_version != schema::kPolicyDocumentVersion) {
      spdlog::error("Container '{}' rendered unsupported version '{}' from {}",
                    id_, document.policy_version, entry->to_string());
      return compose_error(
          to_code(error_code::unsupported_policy_version),
          "unsupported policy version '" + document.policy_version + "'",
          kComposeCodespace);
    }

    account_policies[account.name].push_back(std::move(document));
    scope.insert(std::begin(source.scope()), std::end(source.scope()));

    if (!source.service_role()) {
      continue;
    }
    const auto& role = *source.service_role();
    auto role_policy =
        source.render_service_role(*this, account, entry->variables());
    if (role_policy.code != 0 || !role_policy.document) {
      return compose_error(
          role_policy.code != 0 ? role_policy.code
                                : to_code(error_code::render_failed),
          role_policy.code != 0
              ? std::move(role_policy.log)
              : "policy template '" + source.key() +
                    "' rendered no policy for service role '" + role.name +
                    "'",
          kRenderCodespace);
    }
    auto assume_role_policy =
        source.render_service_assume_role(*this, account, entry->variables());
    if (assume_role_policy.code != 0 || !assume_role_policy.document) {
      return compose_error(
          assume_role_policy.code != 0 ? assume_role_policy.code
                                       : to_code(error_code::render_failed),
          assume_role_policy.code != 0
              ? std::move(assume_role_policy.log)
              : "policy template '" + source.key() +
                    "' rendered no assume role policy for service role '" +
                    role.name + "'",
          kRenderCodespace);
    }

    // Last attachment for an account and role wins.
    service_role_policies[account.name][role.name] =
        schema::service_role_policy_t{
            .policy = std::move(*role_policy.document),
            .assume_role_policy = std::move(*assume_role_policy.document)};
  }

  for (const auto& [account_name, scope] : scopes) {
    auto& documents = account_policies[account_name];
    documents.push_back(make_document(
        scope.empty() ? make_deny_all() : make_deny_unknown_services(scope)));
    account_role_policies[account_name] = documents;
    if (!scope.empty()) {
      documents.push_back(make_document(make_allow_all()));
    }
  }

  auto composed = schema::policy_t{};
  composed.account_policies = std::move(account_policies);
  composed.account_role_policies = std::move(account_role_policies);
  composed.service_role_policies = std::move(service_role_policies);

  auto compressed = compression::compress(composed, limits);
  if (compressed.code != 0) {
    spdlog::error("Container '{}' policy failed compression: {}", id_,
                  compressed.log);
    return compose_error(compressed.code, std::move(compressed.log),
                         compressed.codespace.c_str());
  }

  spdlog::debug("Container '{}' composed policy for {} account(s), {} missing",
                id_, scopes.size(), missing.size());
  auto result = compose_result{};
  result.policy = std::move(composed);
  result.missing = std::move(missing);
  return result;
}

std::size_t container::attachment_count() const {
  auto lock = std::shared_lock{mutex_};
  return attachments_.size();
}

std::vector<std::shared_ptr<const attachment>> container::attachments() const {
  auto lock = std::shared_lock{mutex_};
  return attachments_;
}

}  // namespace rampart::composition
