#pragma once

#include "upd_common/constants.hpp"
#include "upd_common/utility.hpp"
#include "upd_mkimg/crc32.hpp"
#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdlib>
#include <iterator>
#include <span>
#include <spdlog/spdlog.h>
#include <vector>

namespace updlink {

struct AppHeader {
  std::uint32_t magic_number_ = APP_MAGIC_NUMBER;
  std::uint8_t fw_major_      = DEFAULT_FW_MAJOR;
  std::uint8_t fw_minor_      = DEFAULT_FW_MINOR;
  std::uint8_t bl_ver_min_    = DEFAULT_BL_VER_MIN;
  std::uint8_t hw_type_       = to_underlying(HardwareType::Generic);
  std::uint32_t app_size_     = 0;
  std::uint32_t app_crc32_    = 0;
  std::uint32_t entry_point_  = DEFAULT_ENTRY_POINT;
  std::uint32_t header_crc32_ = 0;
  std::array<std::uint8_t, APP_HEADER_SIZE - APP_METADATA_SIZE> pad_{};
};

static_assert(sizeof(AppHeader) == APP_HEADER_SIZE);
static_assert(APP_METADATA_SIZE == 24);

struct AppHeaderParams {
  std::uint8_t fw_major_     = DEFAULT_FW_MAJOR;
  std::uint8_t fw_minor_     = DEFAULT_FW_MINOR;
  std::uint8_t hw_type_      = to_underlying(HardwareType::Generic);
  std::uint8_t bl_ver_min_   = DEFAULT_BL_VER_MIN;
  std::uint32_t entry_point_ = DEFAULT_ENTRY_POINT;
};

struct AppHeaderImage {
  std::array<std::uint8_t, APP_HEADER_SIZE> bytes_{};
  std::uint32_t app_crc32_    = 0;
  std::uint32_t header_crc32_ = 0;
};

namespace detail {

[[noreturn]] inline void header_packing_defect(std::size_t const t_size) noexcept {
  spdlog::critical("App header packing defect: assembled {} bytes, expected {}", t_size, APP_HEADER_SIZE);
  std::abort();
}

inline void append_word(std::vector<std::uint8_t>& t_buffer, std::uint32_t const t_word) {
  auto const bytes = word_to_byte_array(t_word);
  t_buffer.insert(t_buffer.end(), bytes.begin(), bytes.end());
}

}  // namespace detail

/**
 * @brief Build the 64 byte header the bootloader expects in front of the application
 *
 * @param t_payload   application binary, its length goes to app_size, caller guarantees it fits in 32 bits
 * @param t_params    version, hardware and load information
 * @return            header bytes together with the payload and header CRC
 */
[[nodiscard]] inline AppHeaderImage make_app_header(std::span<std::uint8_t const> t_payload,
                                                    AppHeaderParams const& t_params) {
  auto const app_crc = crc32(t_payload);

  std::vector<std::uint8_t> buffer;
  buffer.reserve(APP_HEADER_SIZE);
  detail::append_word(buffer, APP_MAGIC_NUMBER);
  buffer.push_back(t_params.fw_major_);
  buffer.push_back(t_params.fw_minor_);
  buffer.push_back(t_params.bl_ver_min_);
  buffer.push_back(t_params.hw_type_);
  detail::append_word(buffer, static_cast<std::uint32_t>(t_payload.size()));
  detail::append_word(buffer, app_crc);
  detail::append_word(buffer, t_params.entry_point_);

  if (buffer.size() != APP_HEADER_CRC_SPAN) {
    detail::header_packing_defect(buffer.size());
  }

  // header crc covers magic through entry_point, never itself or the padding
  auto const header_crc = crc32(buffer);
  detail::append_word(buffer, header_crc);
  std::fill_n(std::back_inserter(buffer), APP_HEADER_SIZE - APP_METADATA_SIZE, APP_HEADER_PAD_BYTE);

  if (buffer.size() != APP_HEADER_SIZE) {
    detail::header_packing_defect(buffer.size());
  }

  AppHeaderImage ret_val{.app_crc32_ = app_crc, .header_crc32_ = header_crc};
  std::copy(buffer.begin(), buffer.end(), ret_val.bytes_.begin());
  return ret_val;
}

}  // namespace updlink
