#pragma once

#include <rampart/composition/attachment.hpp>
#include <rampart/composition/policy_template.hpp>
#include <rampart/composition/registry.hpp>
#include <rampart/compression/compressor.hpp>
#include <rampart/schema/operation_result.hpp>
#include <rampart/schema/policy.hpp>
#include <rampart/schema/primitives.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace rampart::composition {

/// Outcome of `container::policy`.
///
/// On failure `policy` is empty. On success `missing` lists attachments whose
/// template rendered no document; each left an empty placeholder document.
struct compose_result final {
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::optional<schema::policy_t> policy;
  std::vector<std::shared_ptr<const attachment>> missing;
};

/// Unit of composition: an append-only list of attachments.
///
/// The container's lock is independent of the registry's. Operations that
/// need both take the registry lock first.
class container final {
 public:
  container(registry& owner, std::string id);

  container(const container&) = delete;
  container& operator=(const container&) = delete;

  const std::string& id() const { return id_; }

  /// Register `candidate` in the owning registry, owned by this
  /// container.
  schema::operation_result_t add_policy_template(
      std::shared_ptr<policy_template> candidate);

  /// Attach a registered template to a registered account.
  ///
  /// Every variable the template requires must be bound in `variables`.
  /// On failure the attachment list is unchanged.
  attach_result add_attachment(std::string_view template_key,
                               std::string_view account_name,
                               schema::variables_t variables);

  /// Compose the default-deny policy of every account attached so far.
  ///
  /// Renders attachments in insertion order. The first render, version or
  /// compression failure aborts the whole composition.
  compose_result policy(
      const compression::limits& limits = compression::limits{}) const;

  std::size_t attachment_count() const;
  std::vector<std::shared_ptr<const attachment>> attachments() const;

 private:
  registry& registry_;
  std::string id_;
  mutable std::shared_mutex mutex_;
  std::vector<std::shared_ptr<const attachment>> attachments_;
};

}  // namespace rampart::composition
