#pragma once

#include <rampart/composition/container.hpp>
#include <rampart/composition/registry.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rampart::manifest {

/// Registry and containers populated from a manifest.
///
/// The registry is declared first so containers are destroyed before it.
struct loaded_manifest final {
  std::unique_ptr<composition::registry> registry;
  std::vector<std::unique_ptr<composition::container>> containers;
};

struct load_result final {
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::optional<loaded_manifest> loaded;
};

/// Load a manifest from a JSON file.
load_result load_file(std::string_view path);

/// Load a manifest from JSON text.
///
/// Accounts register first, then every container's templates, then every
/// container's attachments, so attachments may reference templates owned by
/// any container.
load_result load_text(std::string_view text);

}  // namespace rampart::manifest
