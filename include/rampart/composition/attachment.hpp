#pragma once

#include <rampart/composition/policy_template.hpp>
#include <rampart/schema/account.hpp>
#include <rampart/schema/primitives.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace rampart::composition {

/// Binding of one template to one account, owned by a container.
///
/// Immutable once created; every required template variable is bound.
class attachment final {
 public:
  attachment(std::shared_ptr<const policy_template> source_template,
             std::shared_ptr<const schema::account_t> account,
             schema::variables_t variables);

  const policy_template& source_template() const { return *source_template_; }
  const schema::account_t& account() const { return *account_; }
  const schema::variables_t& variables() const { return variables_; }

  /// "<template key>@<account name>", used in diagnostics.
  std::string to_string() const;

 private:
  std::shared_ptr<const policy_template> source_template_;
  std::shared_ptr<const schema::account_t> account_;
  schema::variables_t variables_;
};

struct attach_result final {
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::shared_ptr<const composition::attachment> attached;
};

}  // namespace rampart::composition
