#pragma once

#include "upd_mkimg/app_header.hpp"
#include <cstdint>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace updlink {

enum class ImageErrc { input_not_found, input_read_failure, empty_input, payload_too_large, output_write_failure };

class ImageError : public std::runtime_error {
 public:
  ImageError(ImageErrc const t_code, std::string const& t_what) : std::runtime_error(t_what), code_{t_code} {}

  [[nodiscard]] ImageErrc code() const noexcept { return this->code_; }

 private:
  ImageErrc code_;
};

struct ImageSummary {
  std::filesystem::path output_;
  std::uint64_t total_size_   = 0;
  std::uint32_t header_size_  = APP_HEADER_SIZE;
  std::uint32_t payload_size_ = 0;
  AppHeaderImage header_;
};

/**
 * @brief Read the whole application binary, rejects missing, unreadable, empty and oversized input
 */
[[nodiscard]] std::vector<std::uint8_t> read_payload(std::filesystem::path const& t_input);

/**
 * @brief Write header followed by payload, the output file is truncated first
 */
void write_update_image(std::filesystem::path const& t_output, AppHeaderImage const& t_header,
                        std::span<std::uint8_t const> t_payload);

/**
 * @brief Prepend the app header to an already loaded payload and persist the result
 */
ImageSummary make_update_image(std::span<std::uint8_t const> t_payload, std::filesystem::path const& t_output,
                               AppHeaderParams const& t_params);

ImageSummary make_update_image(std::filesystem::path const& t_input, std::filesystem::path const& t_output,
                               AppHeaderParams const& t_params);

std::string_view to_string(ImageErrc t_code) noexcept;

}  // namespace updlink
