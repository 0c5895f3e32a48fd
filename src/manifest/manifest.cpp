#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <rampart/composition/document_template.hpp>
#include <rampart/manifest/manifest.hpp>
#include <rampart/schema/encoding/json/encoder.hpp>
#include <rampart/schema/error_code.hpp>

#include <exception>
#include <fstream>
#include <iterator>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

using namespace rampart::schema;

namespace {

using encoder_t = rampart::schema::encoding::encoder<
    rampart::schema::encoding::json_encoder_tag>;

constexpr auto kCodespace = "rampart.manifest";

rampart::manifest::load_result load_error(std::string log) {
  auto result = rampart::manifest::load_result{};
  result.code = to_code(error_code::invalid_manifest);
  result.log = std::move(log);
  result.codespace = kCodespace;
  return result;
}

rampart::manifest::load_result forward_error(const uint32_t code,
                                             std::string log,
                                             std::string codespace) {
  auto result = rampart::manifest::load_result{};
  result.code = code;
  result.log = std::move(log);
  result.codespace = std::move(codespace);
  return result;
}

string_list_t optional_string_list(const nlohmann::json& in,
                                   const char* field) {
  auto it = in.find(field);
  if (it == std::end(in)) {
    return {};
  }
  return it->get<string_list_t>();
}

// Template bodies stay JSON text until render so placeholders can be
// substituted; an absent body renders nothing.
std::optional<std::string> optional_body(const nlohmann::json& in,
                                         const char* field) {
  auto it = in.find(field);
  if (it == std::end(in) || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_object()) {
    throw std::invalid_argument{"field '" + std::string{field} +
                                "' must be a policy document object"};
  }
  return it->dump();
}

std::shared_ptr<rampart::composition::document_template> make_template(
    const nlohmann::json& in) {
  auto key = in.at("key").get<std::string>();
  auto sources = rampart::composition::document_sources{};
  sources.document = optional_body(in, "document");

  auto service_role = std::optional<service_role_t>{};
  if (auto it = in.find("service_role"); it != std::end(in)) {
    service_role = service_role_t{.name = it->at("name").get<std::string>()};
    sources.service_role_policy = optional_body(*it, "policy");
    sources.service_assume_role_policy =
        optional_body(*it, "assume_role_policy");
  }

  return std::make_shared<rampart::composition::document_template>(
      std::move(key), optional_string_list(in, "variables"),
      optional_string_list(in, "scope"), std::move(sources),
      std::move(service_role));
}

rampart::manifest::load_result populate(const nlohmann::json& document) {
  auto loaded = rampart::manifest::loaded_manifest{};
  loaded.registry = std::make_unique<rampart::composition::registry>();

  if (auto it = document.find("accounts"); it != std::end(document)) {
    for (const auto& item : *it) {
      auto error = std::string{};
      auto account = encoder_t{}.try_from_json<account_t>(item, error);
      if (!account) {
        return load_error("invalid account: " + error);
      }
      auto added = loaded.registry->add_account(std::move(*account));
      if (added.code != 0) {
        return forward_error(added.code, std::move(added.log),
                             std::move(added.codespace));
      }
    }
  }

  auto containers = document.value("containers", nlohmann::json::array());
  auto ids = std::set<std::string>{};
  for (const auto& item : containers) {
    auto id = item.at("id").get<std::string>();
    if (!ids.insert(id).second) {
      return load_error("duplicate container '" + id + "'");
    }
    auto& created =
        loaded.containers.emplace_back(std::make_unique<rampart::composition::container>(
            *loaded.registry, std::move(id)));
    for (const auto& entry :
         item.value("templates", nlohmann::json::array())) {
      auto added = created->add_policy_template(make_template(entry));
      if (added.code != 0) {
        return forward_error(added.code, std::move(added.log),
                             std::move(added.codespace));
      }
    }
  }

  for (std::size_t i = 0; i < containers.size(); ++i) {
    auto& target = loaded.containers[i];
    for (const auto& entry :
         containers[i].value("attachments", nlohmann::json::array())) {
      auto attached = target->add_attachment(
          entry.at("template").get<std::string>(),
          entry.at("account").get<std::string>(),
          entry.value("variables", variables_t{}));
      if (attached.code != 0) {
        return forward_error(attached.code, std::move(attached.log),
                             std::move(attached.codespace));
      }
    }
  }

  spdlog::info("Loaded manifest with {} account(s), {} template(s), {} "
               "container(s)",
               loaded.registry->account_count(),
               loaded.registry->policy_template_count(),
               loaded.containers.size());
  auto result = rampart::manifest::load_result{};
  result.loaded = std::move(loaded);
  return result;
}

}  // namespace

namespace rampart::manifest {

load_result load_file(std::string_view path) {
  auto stream = std::ifstream{std::string{path}};
  if (!stream) {
    return load_error("cannot open manifest '" + std::string{path} + "'");
  }
  auto buffer = std::stringstream{};
  buffer << stream.rdbuf();
  return load_text(buffer.str());
}

load_result load_text(std::string_view text) {
  auto document = nlohmann::json::parse(text, nullptr, false);
  if (document.is_discarded() || !document.is_object()) {
    return load_error("manifest must be a JSON object");
  }
  try {
    return populate(document);
  } catch (const std::exception& ex) {
    return load_error(std::string{"malformed manifest: "} + ex.what());
  }
}

}  // namespace rampart::manifest
