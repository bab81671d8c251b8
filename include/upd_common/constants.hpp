#pragma once

#include <cstdint>

namespace updlink {

inline constexpr std::uint32_t APP_MAGIC_NUMBER    = 0x454D4F57;  // "WOME"
inline constexpr std::uint32_t APP_HEADER_SIZE     = 64;
inline constexpr std::uint32_t APP_HEADER_CRC_SPAN = 20;
inline constexpr std::uint32_t APP_METADATA_SIZE   = APP_HEADER_CRC_SPAN + sizeof(std::uint32_t);
inline constexpr std::uint8_t APP_HEADER_PAD_BYTE  = 0xFF;
inline constexpr std::uint32_t DEFAULT_ENTRY_POINT = 0x0C80;

inline constexpr std::uint8_t DEFAULT_FW_MAJOR   = 1;
inline constexpr std::uint8_t DEFAULT_FW_MINOR   = 0;
inline constexpr std::uint8_t DEFAULT_BL_VER_MIN = 1;

// bootloader flash map
inline constexpr std::uint32_t BL_APP_CODE_ADDR = 0x0C80;
inline constexpr std::uint32_t BL_FLASH_END     = 0x4000;
inline constexpr std::uint32_t BL_APP_MAX_SIZE  = BL_FLASH_END - BL_APP_CODE_ADDR;

inline constexpr std::uint32_t FW_METADATA_MAGIC  = 0x5458454B;  // "KEXT"
inline constexpr std::uint32_t FW_METADATA_OFFSET = 0x100;
inline constexpr std::uint32_t FW_METADATA_SIZE   = 32;

enum class HardwareType : std::uint8_t { Generic = 0x00, Watchdog = 0x04 };

}  // namespace updlink
