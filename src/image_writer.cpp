#include "upd_mkimg/image_writer.hpp"
#include <fmt/format.h>
#include <fstream>
#include <iterator>
#include <limits>
#include <spdlog/spdlog.h>
#include <system_error>

namespace updlink {

std::vector<std::uint8_t> read_payload(std::filesystem::path const& t_input) {
  std::error_code ec;
  if (not std::filesystem::exists(t_input, ec)) {
    throw ImageError(ImageErrc::input_not_found, fmt::format("Error: Input file '{}' not found", t_input.string()));
  }

  if (not std::filesystem::is_regular_file(t_input, ec)) {
    throw ImageError(ImageErrc::input_read_failure,
                     fmt::format("Error reading '{}': not a regular file", t_input.string()));
  }

  std::ifstream file_handle{t_input, std::ios::in | std::ios::binary};
  if (not file_handle.is_open()) {
    throw ImageError(ImageErrc::input_read_failure, fmt::format("Error reading '{}': cannot open file", t_input.string()));
  }

  std::vector<std::uint8_t> payload{std::istreambuf_iterator<char>(file_handle), std::istreambuf_iterator<char>()};
  if (file_handle.bad()) {
    throw ImageError(ImageErrc::input_read_failure, fmt::format("Error reading '{}': I/O error", t_input.string()));
  }

  if (payload.empty()) {
    throw ImageError(ImageErrc::empty_input, "Error: Input file is empty");
  }

  if (payload.size() > std::numeric_limits<std::uint32_t>::max()) {
    throw ImageError(ImageErrc::payload_too_large,
                     fmt::format("Error: Input file is {} bytes, app_size field holds at most {}", payload.size(),
                                 std::numeric_limits<std::uint32_t>::max()));
  }

  spdlog::debug("Read {} bytes from {}", payload.size(), t_input.string());
  return payload;
}

void write_update_image(std::filesystem::path const& t_output, AppHeaderImage const& t_header,
                        std::span<std::uint8_t const> t_payload) {
  std::ofstream output_file_handle{t_output, std::ios::out | std::ios::binary | std::ios::trunc};
  if (not output_file_handle.is_open()) {
    throw ImageError(ImageErrc::output_write_failure,
                     fmt::format("Error writing '{}': cannot open file", t_output.string()));
  }

  output_file_handle.write(reinterpret_cast<char const*>(t_header.bytes_.data()),
                           static_cast<std::streamsize>(t_header.bytes_.size()));
  output_file_handle.write(reinterpret_cast<char const*>(t_payload.data()),
                           static_cast<std::streamsize>(t_payload.size()));
  output_file_handle.flush();

  if (not output_file_handle) {
    throw ImageError(ImageErrc::output_write_failure, fmt::format("Error writing '{}': I/O error", t_output.string()));
  }
}

ImageSummary make_update_image(std::span<std::uint8_t const> t_payload, std::filesystem::path const& t_output,
                               AppHeaderParams const& t_params) {
  auto const header = make_app_header(t_payload, t_params);
  write_update_image(t_output, header, t_payload);

  return ImageSummary{
    .output_       = t_output,
    .total_size_   = header.bytes_.size() + t_payload.size(),
    .header_size_  = APP_HEADER_SIZE,
    .payload_size_ = static_cast<std::uint32_t>(t_payload.size()),
    .header_       = header,
  };
}

ImageSummary make_update_image(std::filesystem::path const& t_input, std::filesystem::path const& t_output,
                               AppHeaderParams const& t_params) {
  auto const payload = read_payload(t_input);
  return make_update_image(payload, t_output, t_params);
}

std::string_view to_string(ImageErrc const t_code) noexcept {
  switch (t_code) {
    case ImageErrc::input_not_found:
      return "input not found";
    case ImageErrc::input_read_failure:
      return "input read failure";
    case ImageErrc::empty_input:
      return "empty input";
    case ImageErrc::payload_too_large:
      return "payload too large";
    case ImageErrc::output_write_failure:
      return "output write failure";
  }

  return "unknown";
}

}  // namespace updlink
