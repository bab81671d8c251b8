#include "upd_mkimg/command_line.hpp"
#include "upd_mkimg/fw_metadata.hpp"
#include "upd_mkimg/image_writer.hpp"
#include <boost/program_options.hpp>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

namespace bpo = boost::program_options;

namespace {

void mk_update_image(std::filesystem::path const& t_input, std::filesystem::path const& t_output,
                     bpo::variables_map const& t_vm) {
  auto const payload = updlink::read_payload(t_input);
  auto const meta    = updlink::find_fw_metadata(payload);
  if (meta) {
    updlink::print_fw_metadata(*meta);
  } else if (t_vm.count("from-metadata") != 0) {
    spdlog::warn("No embedded metadata found in {}, using command line values", t_input.string());
  }

  auto const params = updlink::resolve_params(t_vm, meta);
  for (auto const& warning : updlink::check_against_flash_map(payload.size(), params)) {
    spdlog::warn(warning);
  }

  if (meta) {
    for (auto const& warning : updlink::check_against_metadata(*meta, params)) {
      spdlog::warn(warning);
    }
  }

  auto const summary = updlink::make_update_image(payload, t_output, params);

  if (spdlog::get_level() == spdlog::level::debug) {
    spdlog::set_pattern("%v");
    spdlog::debug(
      "Input:      {} ({} bytes)\n"
      "Output:     {} ({} bytes)\n"
      "FW Version: {}.{}\n"
      "HW Type:    {}\n"
      "BL Ver Min: {}\n"
      "Entry:      0x{:04X}\n"
      "App CRC32:  0x{:08X}\n"
      "Hdr CRC32:  0x{:08X}\n",
      t_input.string(), summary.payload_size_, summary.output_.string(), summary.total_size_, params.fw_major_,
      params.fw_minor_, params.hw_type_, params.bl_ver_min_, params.entry_point_, summary.header_.app_crc32_,
      summary.header_.header_crc32_);
    updlink::print_app_header(summary.header_);
  }

  spdlog::info("Created {}: {} bytes (header={}, app={}, crc=0x{:08X})", summary.output_.string(), summary.total_size_,
               summary.header_size_, summary.payload_size_, summary.header_.app_crc32_);
}

}  // namespace

int main(int argc, char** argv) {
  try {
    auto cli = updlink::parse_command_line(argc, argv);
    auto& vm = cli.vm_;
    if (vm.count("help") != 0) {
      std::cout << "Usage: upd_mkimg <input.bin> <output.upd> [options]\n" << cli.visible_option_ << '\n';
      return EXIT_SUCCESS;
    }

    bpo::notify(vm);
    if (vm.count("verbose") != 0) {
      spdlog::set_level(spdlog::level::debug);
    }

    ::mk_update_image(vm["input"].as<std::string>(), vm["output"].as<std::string>(), vm);
  } catch (updlink::ImageError& t_e) {
    spdlog::debug("Image generation failed: {}", updlink::to_string(t_e.code()));
    std::cerr << t_e.what() << '\n';
    return EXIT_FAILURE;
  } catch (std::exception& t_e) {
    std::cerr << t_e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
