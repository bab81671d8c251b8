#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace updlink {

// IEEE 802.3 CRC-32, reflected, zlib compatible
inline constexpr std::uint32_t CRC32_POLYNOMIAL = 0xEDB88320;
inline constexpr std::uint32_t CRC32_INIT       = 0xFFFFFFFF;
inline constexpr std::uint32_t CRC32_XOR_OUT    = 0xFFFFFFFF;

namespace detail {

constexpr std::uint32_t crc32_byte(std::uint32_t t_crc, std::uint8_t const t_byte) noexcept {
  t_crc ^= t_byte;
  for (auto bit = 0; bit < 8; ++bit) {
    t_crc = (t_crc & 1U) != 0 ? (t_crc >> 1U) ^ CRC32_POLYNOMIAL : t_crc >> 1U;
  }

  return t_crc;
}

inline constexpr auto CRC32_TABLE = []() {
  std::array<std::uint32_t, 256> table{};
  for (std::uint32_t i = 0; i < table.size(); ++i) {
    table[i] = crc32_byte(i, 0);
  }

  return table;
}();

}  // namespace detail

class Crc32 {
 public:
  constexpr Crc32& update(std::span<std::uint8_t const> t_data) noexcept {
    for (auto const byte : t_data) {
      this->reg_ = detail::CRC32_TABLE[(this->reg_ ^ byte) & 0xFFU] ^ (this->reg_ >> 8U);
    }

    return *this;
  }

  [[nodiscard]] constexpr std::uint32_t value() const noexcept { return this->reg_ ^ CRC32_XOR_OUT; }

 private:
  std::uint32_t reg_ = CRC32_INIT;
};

[[nodiscard]] constexpr std::uint32_t crc32(std::span<std::uint8_t const> t_data) noexcept {
  return Crc32{}.update(t_data).value();
}

/**
 * @brief Bit at a time CRC-32, kept as the reference the table driven version is checked against.
 */
[[nodiscard]] constexpr std::uint32_t crc32_bitwise(std::span<std::uint8_t const> t_data) noexcept {
  std::uint32_t crc = CRC32_INIT;
  for (auto const byte : t_data) {
    crc = detail::crc32_byte(crc, byte);
  }

  return crc ^ CRC32_XOR_OUT;
}

}  // namespace updlink
