#pragma once

#include "upd_mkimg/app_header.hpp"
#include "upd_mkimg/fw_metadata.hpp"
#include <boost/program_options.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace updlink {

struct CommandLine {
  boost::program_options::options_description visible_option_{"Options"};
  boost::program_options::variables_map vm_;
};

/**
 * @brief Store argv into a variables map, help is checked by the caller before notify
 */
CommandLine parse_command_line(int t_argc, char const* const* t_argv);

/**
 * @brief Explicit options first, then the embedded metadata when --from-metadata is given, then the defaults
 */
AppHeaderParams resolve_params(boost::program_options::variables_map const& t_vm,
                               std::optional<FwMetadata> const& t_meta);

std::vector<std::string> check_against_flash_map(std::size_t t_payload_size, AppHeaderParams const& t_params);

std::vector<std::string> check_against_metadata(FwMetadata const& t_meta, AppHeaderParams const& t_params);

void print_fw_metadata(FwMetadata const& t_meta);

void print_app_header(AppHeaderImage const& t_header);

}  // namespace updlink
