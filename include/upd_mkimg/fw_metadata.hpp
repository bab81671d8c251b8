#pragma once

#include "upd_common/constants.hpp"
#include "upd_common/utility.hpp"
#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace updlink {

enum class FirmwareType : std::uint8_t { Boot = 0x00, App = 0x01 };

/**
 * @brief Descriptor some application builds embed at FW_METADATA_OFFSET
 *
 *  offset  size  field
 *  0       4     magic ("KEXT")
 *  4       4     load address
 *  8       1     hardware type
 *  9       1     version major
 *  10      1     version minor
 *  11      1     flags, bit 0 set for application firmware
 *  12      16    name, NUL terminated
 *  28      4     reserved
 */
struct FwMetadata {
  std::uint32_t load_addr_    = 0;
  std::uint8_t hw_type_       = 0;
  std::uint8_t version_major_ = 0;
  std::uint8_t version_minor_ = 0;
  std::uint8_t flags_         = 0;
  std::string name_;

  [[nodiscard]] constexpr FirmwareType get_type() const noexcept {
    return static_cast<FirmwareType>(this->flags_ & 0x01U);
  }

  [[nodiscard]] constexpr bool is_app_firmware() const noexcept { return this->get_type() == FirmwareType::App; }
};

[[nodiscard]] inline std::optional<FwMetadata> find_fw_metadata(std::span<std::uint8_t const> t_payload) {
  if (t_payload.size() < FW_METADATA_OFFSET + FW_METADATA_SIZE) {
    return std::nullopt;
  }

  auto const raw = t_payload.subspan(FW_METADATA_OFFSET, FW_METADATA_SIZE);
  if (byte_array_to_word(raw.begin()) != FW_METADATA_MAGIC) {
    return std::nullopt;
  }

  constexpr auto NAME_OFFSET = 12U;
  constexpr auto NAME_LENGTH = 16U;
  auto const name_begin      = raw.begin() + NAME_OFFSET;
  auto const name_end        = std::find(name_begin, name_begin + NAME_LENGTH, std::uint8_t{0});

  return FwMetadata{
    .load_addr_     = byte_array_to_word(raw.begin() + 4),
    .hw_type_       = raw[8],
    .version_major_ = raw[9],
    .version_minor_ = raw[10],
    .flags_         = raw[11],
    .name_          = std::string(name_begin, name_end),
  };
}

}  // namespace updlink
