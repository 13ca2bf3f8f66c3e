#pragma once

#include <custodia/policy/custody_policy.hpp>
#include <custodia/schema/operation_result.hpp>

#include <boost/program_options.hpp>
#include <spdlog/common.h>

#include <string>
#include <string_view>
#include <vector>

namespace custodia::config {

struct node_config final {
  std::string db_path{"custodia-db"};
  spdlog::level::level_enum log_level{spdlog::level::info};
  std::string log_file{"custodia.log"};
  custodia::policy::custody_policy policy{
      custodia::policy::default_custody_policy()};
};

/// Options shared by the command line and INI config files:
/// db-path, log-level, log-file and the policy.* section.
boost::program_options::options_description make_node_options();

/// Build a node_config from parsed options, validating each value.
custodia::schema::operation_result<node_config> make_node_config(
    const boost::program_options::variables_map& vm);

/// Store the options of the INI file at `path` into `vm`. Values already in
/// `vm` (from the command line) take precedence.
custodia::schema::operation_result<bool> load_config_file(
    const std::string& path,
    const boost::program_options::options_description& options,
    boost::program_options::variables_map& vm);

/// Split a comma separated list, trimming blanks and dropping empty items.
std::vector<std::string> split_list(std::string_view value);

}  // namespace custodia::config
