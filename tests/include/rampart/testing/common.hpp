#pragma once

#include <rampart/composition/container.hpp>
#include <rampart/composition/policy_template.hpp>
#include <rampart/composition/registry.hpp>
#include <rampart/schema/error_code.hpp>
#include <rampart/schema/policy_document.hpp>
#include <rampart/schema/render_result.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace rampart::testing {

using render_fn_t = std::function<rampart::schema::render_result_t(
    const rampart::composition::container&,
    const rampart::schema::account_t&,
    const rampart::schema::variables_t&)>;

/// Template whose renderers are supplied by the test.
class stub_template final : public rampart::composition::policy_template {
 public:
  stub_template(std::string key,
                rampart::schema::string_list_t variables,
                rampart::schema::scope_t scope,
                render_fn_t render,
                std::optional<rampart::schema::service_role_t> service_role =
                    std::nullopt,
                render_fn_t render_role = {},
                render_fn_t render_assume_role = {})
      : policy_template{std::move(key), std::move(variables),
                        std::move(scope), std::move(service_role)},
        render_{std::move(render)},
        render_role_{std::move(render_role)},
        render_assume_role_{std::move(render_assume_role)} {}

  rampart::schema::render_result_t render(
      const rampart::composition::container& owner,
      const rampart::schema::account_t& account,
      const rampart::schema::variables_t& variables) const override {
    ++render_calls_;
    return render_(owner, account, variables);
  }

  rampart::schema::render_result_t render_service_role(
      const rampart::composition::container& owner,
      const rampart::schema::account_t& account,
      const rampart::schema::variables_t& variables) const override {
    return render_role_(owner, account, variables);
  }

  rampart::schema::render_result_t render_service_assume_role(
      const rampart::composition::container& owner,
      const rampart::schema::account_t& account,
      const rampart::schema::variables_t& variables) const override {
    return render_assume_role_(owner, account, variables);
  }

  int render_calls() const { return render_calls_.load(); }

 private:
  render_fn_t render_;
  render_fn_t render_role_;
  render_fn_t render_assume_role_;
  mutable std::atomic<int> render_calls_{0};
};

/// Versioned document with a single Allow statement.
inline rampart::schema::policy_document_t make_document(
    const std::string_view sid,
    const std::string_view action,
    const std::string_view resource = "*") {
  auto statement = rampart::schema::policy_statement_t{};
  statement.sid = std::string{sid};
  statement.effect = rampart::schema::effect_t::allow;
  statement.actions = {std::string{action}};
  statement.resources = {std::string{resource}};

  auto document = rampart::schema::policy_document_t{};
  document.policy_version =
      std::string{rampart::schema::kPolicyDocumentVersion};
  document.statements.push_back(std::move(statement));
  return document;
}

inline render_fn_t renders(rampart::schema::policy_document_t document) {
  return [document = std::move(document)](
             const rampart::composition::container&,
             const rampart::schema::account_t&,
             const rampart::schema::variables_t&) {
    auto result = rampart::schema::render_result_t{};
    result.document = document;
    return result;
  };
}

inline render_fn_t renders_nothing() {
  return [](const rampart::composition::container&,
            const rampart::schema::account_t&,
            const rampart::schema::variables_t&) {
    return rampart::schema::render_result_t{};
  };
}

inline render_fn_t fails(const uint32_t code, std::string log) {
  return [code, log = std::move(log)](const rampart::composition::container&,
                                      const rampart::schema::account_t&,
                                      const rampart::schema::variables_t&) {
    auto result = rampart::schema::render_result_t{};
    result.code = code;
    result.log = log;
    return result;
  };
}

inline rampart::schema::account_t make_account(const std::string_view name,
                                               const std::string_view id =
                                                   "123456789012") {
  return rampart::schema::account_t{.name = std::string{name},
                                    .id = std::string{id}};
}

inline std::string make_temp_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void write_file(const std::string& path, const std::string_view text) {
  auto stream = std::ofstream{path};
  stream << text;
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// One registry with one container, plus shortcuts for registration.
class composition_fixture final {
 public:
  explicit composition_fixture(std::string container_id = "web")
      : registry_{}, container_{registry_, std::move(container_id)} {}

  composition_fixture(const composition_fixture&) = delete;
  composition_fixture& operator=(const composition_fixture&) = delete;

  rampart::composition::registry& registry() { return registry_; }
  rampart::composition::container& container() { return container_; }

  void add_account(const std::string_view name) {
    auto result = registry_.add_account(make_account(name));
    if (result.code != 0) {
      throw std::runtime_error{result.log};
    }
  }

  std::shared_ptr<stub_template> add_template(
      std::string key,
      rampart::schema::string_list_t variables,
      rampart::schema::scope_t scope,
      render_fn_t render,
      std::optional<rampart::schema::service_role_t> service_role =
          std::nullopt,
      render_fn_t render_role = {},
      render_fn_t render_assume_role = {}) {
    auto created = std::make_shared<stub_template>(
        std::move(key), std::move(variables), std::move(scope),
        std::move(render), std::move(service_role), std::move(render_role),
        std::move(render_assume_role));
    auto result = container_.add_policy_template(created);
    if (result.code != 0) {
      throw std::runtime_error{result.log};
    }
    return created;
  }

  void attach(const std::string_view key,
              const std::string_view account,
              rampart::schema::variables_t variables = {}) {
    auto result = container_.add_attachment(key, account, std::move(variables));
    if (result.code != 0) {
      throw std::runtime_error{result.log};
    }
  }

 private:
  rampart::composition::registry registry_;
  rampart::composition::container container_;
};

}  // namespace rampart::testing
