#include "upd_mkimg/command_line.hpp"
#include "upd_common/constants.hpp"
#include "upd_common/utility.hpp"
#include "upd_mkimg/options.hpp"
#include <fmt/format.h>
#include <range/v3/algorithm/all_of.hpp>
#include <span>
#include <spdlog/spdlog.h>

namespace bpo = boost::program_options;

namespace updlink {

CommandLine parse_command_line(int const t_argc, char const* const* t_argv) {
  CommandLine ret_val;

  bpo::options_description header_option("Parameter for app header");
  header_option.add_options()                                                               //
    ("major", bpo::value<ByteOption>()->default_value({DEFAULT_FW_MAJOR}, "1"),             //
     "Firmware major version (0-255)")                                                      //
    ("minor", bpo::value<ByteOption>()->default_value({DEFAULT_FW_MINOR}, "0"),             //
     "Firmware minor version (0-255)")                                                      //
    ("hw-type", bpo::value<ByteOption>()->default_value({}, "0"), "Hardware type (0 = generic)")  //
    ("bl-ver-min", bpo::value<ByteOption>()->default_value({DEFAULT_BL_VER_MIN}, "1"),      //
     "Minimum bootloader version")                                                          //
    ("entry", bpo::value<AddressOption>()->default_value({DEFAULT_ENTRY_POINT}, "0x0C80"),  //
     "Entry point address, hex with 0x prefix or decimal")                                  //
    ("from-metadata", "Take version, hardware type and entry point from the metadata embedded in the binary");

  bpo::options_description hidden_option("Positional parameter");
  hidden_option.add_options()                                                     //
    ("input", bpo::value<std::string>()->required(), "Input binary file (.bin)")  //
    ("output", bpo::value<std::string>()->required(), "Output update file (.upd)");

  ret_val.visible_option_.add(header_option)
    .add_options()                                 //
    ("help,h", "Show this help message and exit")  //
    ("verbose,v", "Show debug message during execution");

  bpo::positional_options_description pd;
  pd.add("input", 1).add("output", 1);

  bpo::options_description all_option("Allowed options");
  all_option.add(hidden_option).add(ret_val.visible_option_);

  bpo::store(bpo::command_line_parser(t_argc, t_argv).options(all_option).positional(pd).run(), ret_val.vm_);
  return ret_val;
}

AppHeaderParams resolve_params(bpo::variables_map const& t_vm, std::optional<FwMetadata> const& t_meta) {
  auto const use_meta   = t_meta.has_value() and t_vm.count("from-metadata") != 0;
  auto const embedded   = t_meta.value_or(FwMetadata{});
  auto const byte_field = [&](char const* t_name, std::uint8_t const t_embedded) {
    auto const& value = t_vm[t_name];
    return use_meta and value.defaulted() ? t_embedded : value.as<ByteOption>().value_;
  };

  auto const& entry = t_vm["entry"];
  return AppHeaderParams{
    .fw_major_    = byte_field("major", embedded.version_major_),
    .fw_minor_    = byte_field("minor", embedded.version_minor_),
    .hw_type_     = byte_field("hw-type", embedded.hw_type_),
    .bl_ver_min_  = t_vm["bl-ver-min"].as<ByteOption>().value_,
    .entry_point_ = use_meta and entry.defaulted() ? embedded.load_addr_ : entry.as<AddressOption>().value_,
  };
}

std::vector<std::string> check_against_flash_map(std::size_t const t_payload_size, AppHeaderParams const& t_params) {
  std::vector<std::string> warnings;
  if (t_payload_size > BL_APP_MAX_SIZE) {
    warnings.push_back(
      fmt::format("Application is {} bytes, bootloader accepts at most {} bytes", t_payload_size, BL_APP_MAX_SIZE));
  }

  if (t_params.entry_point_ != BL_APP_CODE_ADDR) {
    warnings.push_back(fmt::format("Entry point {:#06x} is not the application start address {:#06x}",
                                   t_params.entry_point_, BL_APP_CODE_ADDR));
  }

  return warnings;
}

std::vector<std::string> check_against_metadata(FwMetadata const& t_meta, AppHeaderParams const& t_params) {
  std::vector<std::string> warnings;
  if (not t_meta.is_app_firmware()) {
    warnings.push_back(fmt::format(
      "Embedded metadata marks '{}' as BOOT firmware, it is not meant to run behind the bootloader", t_meta.name_));
  }

  if (t_meta.version_major_ != t_params.fw_major_ or t_meta.version_minor_ != t_params.fw_minor_) {
    warnings.push_back(fmt::format("Header version {}.{} differs from embedded version {}.{}", t_params.fw_major_,
                                   t_params.fw_minor_, t_meta.version_major_, t_meta.version_minor_));
  }

  if (t_meta.hw_type_ != t_params.hw_type_) {
    warnings.push_back(fmt::format("Header hardware type {} differs from embedded hardware type {}",
                                   t_params.hw_type_, t_meta.hw_type_));
  }

  if (t_meta.load_addr_ != t_params.entry_point_) {
    warnings.push_back(fmt::format("Entry point {:#06x} differs from embedded load address {:#06x}",
                                   t_params.entry_point_, t_meta.load_addr_));
  }

  return warnings;
}

void print_fw_metadata(FwMetadata const& t_meta) {
  spdlog::debug(
    "Embedded firmware metadata:\n"
    "Name:            {}\n"
    "Type:            {}\n"
    "Version:         {}.{}\n"
    "HW Type:         {}\n"
    "Load address:    {:#06x}",
    t_meta.name_, t_meta.is_app_firmware() ? "APP" : "BOOT", t_meta.version_major_, t_meta.version_minor_,
    t_meta.hw_type_, t_meta.load_addr_);
}

void print_app_header(AppHeaderImage const& t_header) {
  auto const bytes = std::span<std::uint8_t const>{t_header.bytes_};
  auto const pad   = bytes.subspan(APP_METADATA_SIZE);

  spdlog::set_pattern("%v");
  print_byte_block("Metadata", bytes.first(APP_HEADER_CRC_SPAN), 0);
  print_byte_block("Header CRC32", bytes.subspan(APP_HEADER_CRC_SPAN, sizeof(std::uint32_t)), APP_HEADER_CRC_SPAN);
  if (ranges::all_of(pad, [](auto const t_byte) { return t_byte == APP_HEADER_PAD_BYTE; })) {
    spdlog::debug("Padding:\n  {:04X}  {} x {:02X}", APP_METADATA_SIZE, pad.size(), APP_HEADER_PAD_BYTE);
  } else {
    print_byte_block("Padding", pad, APP_METADATA_SIZE);
  }

  spdlog::debug("");
  spdlog::set_pattern("%+");
}

}  // namespace updlink
