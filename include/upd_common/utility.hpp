#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <range/v3/view/chunk.hpp>
#include <span>
#include <string_view>
#include <type_traits>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace updlink::detail {

template <typename T>
concept is_scoped_enum = std ::is_enum_v<T> and not std::is_convertible_v<int, T>;

}  // namespace updlink::detail

namespace updlink {

inline constexpr auto word_to_byte_array = [](std::uint32_t const t_v) {
  auto const high_halfword = t_v >> 16U;
  auto const low_halfword  = t_v & 0xFFFFU;
  return std::array{static_cast<std::uint8_t>(low_halfword & 0xFFU), static_cast<std::uint8_t>(low_halfword >> 8U),
                    static_cast<std::uint8_t>(high_halfword & 0xFFU), static_cast<std::uint8_t>(high_halfword >> 8U)};
};

inline constexpr auto byte_array_to_word = [](auto t_begin) {
  std::uint32_t ret_val = 0;
  for (auto i = 0U; i < sizeof(std::uint32_t); ++i, ++t_begin) {
    ret_val |= static_cast<std::uint32_t>(static_cast<std::uint8_t>(*t_begin)) << (8U * i);
  }

  return ret_val;
};

inline constexpr auto to_underlying(detail::is_scoped_enum auto t_enum) noexcept {
  return static_cast<std::underlying_type_t<decltype(t_enum)>>(t_enum);
}

/**
 * @brief Debug dump of a labelled byte block, eight bytes per line, offsets relative to the enclosing record
 */
inline void print_byte_block(std::string_view t_label, std::span<std::uint8_t const> t_bytes,
                             std::size_t t_offset) noexcept {
  constexpr auto byte_per_line = 8;
  spdlog::debug("{}:", t_label);
  for (auto line : t_bytes | ranges::views::chunk(byte_per_line)) {
    spdlog::debug("  {:04X}  {:02X}", t_offset, fmt::join(line.begin(), line.end(), " "));
    t_offset += byte_per_line;
  }
}

}  // namespace updlink
