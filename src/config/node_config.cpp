#include <custodia/config/node_config.hpp>

#include <array>
#include <fstream>
#include <utility>

using namespace custodia::schema;

namespace po = boost::program_options;

namespace {

constexpr auto kLogLevels = std::array{
    std::pair<std::string_view, spdlog::level::level_enum>{
        "trace", spdlog::level::trace},
    std::pair<std::string_view, spdlog::level::level_enum>{
        "debug", spdlog::level::debug},
    std::pair<std::string_view, spdlog::level::level_enum>{
        "info", spdlog::level::info},
    std::pair<std::string_view, spdlog::level::level_enum>{
        "warn", spdlog::level::warn},
    std::pair<std::string_view, spdlog::level::level_enum>{
        "error", spdlog::level::err},
    std::pair<std::string_view, spdlog::level::level_enum>{
        "critical", spdlog::level::critical},
    std::pair<std::string_view, spdlog::level::level_enum>{
        "off", spdlog::level::off}};

std::string_view trim(std::string_view value) {
  constexpr auto kBlank = std::string_view{" \t\r\n"};
  auto first = value.find_first_not_of(kBlank);
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = value.find_last_not_of(kBlank);
  return value.substr(first, last - first + 1);
}

}  // namespace

namespace custodia::config {

std::vector<std::string> split_list(std::string_view value) {
  auto out = std::vector<std::string>{};
  while (!value.empty()) {
    auto comma = value.find(',');
    auto item = trim(value.substr(0, comma));
    if (!item.empty()) {
      out.emplace_back(item);
    }
    if (comma == std::string_view::npos) {
      break;
    }
    value.remove_prefix(comma + 1);
  }
  return out;
}

po::options_description make_node_options() {
  auto options = po::options_description{"custodia node"};
  options.add_options()(
      "db-path", po::value<std::string>()->default_value("custodia-db"),
      "RocksDB directory of the evidence ledger")(
      "log-level", po::value<std::string>()->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>()->default_value("custodia.log"),
      "log file path")(
      "policy.required-order",
      po::value<std::string>()->default_value(
          "COLLECTED,SEALED,ANALYZED,VERIFIED"),
      "comma separated custody lifecycle")(
      "policy.allowed-skips", po::value<std::string>()->default_value(""),
      "comma separated steps that may be skipped")(
      "policy.max-access-hours", po::value<double>()->default_value(48.0),
      "longest a handler may hold a checkout")(
      "policy.no-parallel-access", po::value<bool>()->default_value(true),
      "allow a single checkout holder per evidence item");
  return options;
}

operation_result<node_config> make_node_config(const po::variables_map& vm) {
  auto config = node_config{};
  config.db_path = vm["db-path"].as<std::string>();
  config.log_file = vm["log-file"].as<std::string>();
  if (config.db_path.empty()) {
    return make_error<node_config>(error_code_t::invalid_input,
                                   "db-path must not be empty");
  }

  auto level = vm["log-level"].as<std::string>();
  auto found = false;
  for (const auto& [name, value] : kLogLevels) {
    if (name == level) {
      config.log_level = value;
      found = true;
    }
  }
  if (!found) {
    return make_error<node_config>(error_code_t::invalid_input,
                                   "unknown log-level '" + level + "'");
  }

  config.policy.required_order =
      split_list(vm["policy.required-order"].as<std::string>());
  config.policy.allowed_skips =
      split_list(vm["policy.allowed-skips"].as<std::string>());
  config.policy.max_access_duration_hours =
      vm["policy.max-access-hours"].as<double>();
  config.policy.no_parallel_access =
      vm["policy.no-parallel-access"].as<bool>();
  if (config.policy.required_order.empty()) {
    return make_error<node_config>(error_code_t::invalid_input,
                                   "policy.required-order must not be empty");
  }
  if (!(config.policy.max_access_duration_hours > 0.0)) {
    return make_error<node_config>(error_code_t::invalid_input,
                                   "policy.max-access-hours must be positive");
  }
  return make_ok(std::move(config));
}

operation_result<bool> load_config_file(const std::string& path,
                                        const po::options_description& options,
                                        po::variables_map& vm) {
  auto input = std::ifstream{path};
  if (!input) {
    return make_error<bool>(error_code_t::invalid_input,
                            "cannot read config file '" + path + "'");
  }
  try {
    po::store(po::parse_config_file(input, options, true), vm);
  } catch (const po::error& ex) {
    return make_error<bool>(error_code_t::invalid_input,
                            "config file '" + path + "': " + ex.what());
  }
  return make_ok(true);
}

}  // namespace custodia::config
