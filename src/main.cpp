#include <nlohmann/json.hpp>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <rampart/common/critical.hpp>
#include <rampart/compression/compressor.hpp>
#include <rampart/manifest/manifest.hpp>
#include <rampart/schema/encoding/json/encoder.hpp>

#include <algorithm>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

using encoder_t = rampart::schema::encoding::encoder<
    rampart::schema::encoding::json_encoder_tag>;

constexpr auto kExitFailure = 1;
constexpr auto kExitMissing = 2;

// Logs go to stderr; stdout carries the composed policy.
void configure_logging(const std::string& level, const std::string& log_file) {
  auto parsed = spdlog::level::from_str(level);
  if (parsed == spdlog::level::off && level != "off") {
    rampart::common::critical("unknown log level '{}'", level);
  }

  spdlog::init_thread_pool(8192, 1);
  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }
  auto logger = std::make_shared<spdlog::async_logger>(
      "rampart", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(parsed);
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  rampart_compose --manifest <file> [options]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto manifest_path = std::string{};
  auto output_path = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto quotas = rampart::compression::limits{};

  auto options = po::options_description{"rampart_compose options"};
  options.add_options()("help,h", "show help")(
      "manifest,m", po::value<std::string>(&manifest_path),
      "manifest JSON file")(
      "container,c", po::value<std::vector<std::string>>()->multitoken(),
      "compose only these container ids")(
      "output,o", po::value<std::string>(&output_path),
      "write composed policies here instead of stdout")(
      "pretty", "indent JSON output")(
      "strict", "exit 2 when any attachment rendered no document")(
      "log-level", po::value<std::string>(&log_level)->default_value("info"),
      "trace|debug|info|warning|error|critical|off")(
      "log-file", po::value<std::string>(&log_file)->default_value(""),
      "also log to this file")(
      "max-document-size",
      po::value<std::size_t>(&quotas.max_document_size)
          ->default_value(quotas.max_document_size),
      "managed policy size limit in characters")(
      "max-documents",
      po::value<std::size_t>(&quotas.max_documents_per_account)
          ->default_value(quotas.max_documents_per_account),
      "managed policies per account")(
      "max-role-policy-size",
      po::value<std::size_t>(&quotas.max_role_policy_size)
          ->default_value(quotas.max_role_policy_size),
      "service role policy size limit in characters")(
      "max-assume-role-policy-size",
      po::value<std::size_t>(&quotas.max_assume_role_policy_size)
          ->default_value(quotas.max_assume_role_policy_size),
      "service role trust policy size limit in characters");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, options), vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n';
    print_help(options);
    return kExitFailure;
  }

  if (vm.contains("help")) {
    print_help(options);
    return 0;
  }

  configure_logging(log_level, log_file);

  if (manifest_path.empty()) {
    rampart::common::critical("--manifest is required");
  }

  auto loaded = rampart::manifest::load_file(manifest_path);
  if (loaded.code != 0) {
    spdlog::error("[{}] {}", loaded.codespace, loaded.log);
    spdlog::shutdown();
    return kExitFailure;
  }

  auto selected = std::vector<std::string>{};
  if (vm.contains("container")) {
    selected = vm["container"].as<std::vector<std::string>>();
  }

  auto output = nlohmann::json::object();
  auto missing_count = std::size_t{0};
  for (const auto& container : loaded.loaded->containers) {
    if (!selected.empty() &&
        std::ranges::find(selected, container->id()) == std::end(selected)) {
      continue;
    }
    auto composed = container->policy(quotas);
    if (composed.code != 0) {
      spdlog::error("[{}] container '{}': {}", composed.codespace,
                    container->id(), composed.log);
      spdlog::shutdown();
      return kExitFailure;
    }
    auto encoded = encoder_t{}.to_json(*composed.policy);
    auto& missing = encoded["missing"];
    missing = nlohmann::json::array();
    for (const auto& entry : composed.missing) {
      missing.push_back(entry->to_string());
    }
    missing_count += composed.missing.size();
    output[container->id()] = std::move(encoded);
  }

  auto text = std::string{};
  try {
    text = vm.contains("pretty") ? output.dump(2) : output.dump();
  } catch (const nlohmann::json::exception& ex) {
    spdlog::error("cannot encode composed policies: {}", ex.what());
    spdlog::shutdown();
    return kExitFailure;
  }
  if (output_path.empty()) {
    std::cout << text << '\n';
  } else {
    auto stream = std::ofstream{output_path};
    if (!stream) {
      rampart::common::critical("cannot write output file '{}'", output_path);
    }
    stream << text << '\n';
  }

  if (missing_count > 0) {
    spdlog::warn("{} attachment(s) rendered no document", missing_count);
  }
  spdlog::shutdown();
  return vm.contains("strict") && missing_count > 0 ? kExitMissing : 0;
}
