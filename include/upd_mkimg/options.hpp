#pragma once

#include <cstdint>
#include <istream>
#include <ostream>

namespace updlink {

/**
 * @brief Command line value for a single byte header field, rejects anything outside 0 to 255
 */
struct ByteOption {
  std::uint8_t value_ = 0;
};

/**
 * @brief 32 bit address, "0x" prefixed hex or decimal
 */
struct AddressOption {
  std::uint32_t value_ = 0;
};

std::istream& operator>>(std::istream& t_in, ByteOption& t_opt);
std::ostream& operator<<(std::ostream& t_out, ByteOption const& t_opt);

std::istream& operator>>(std::istream& t_in, AddressOption& t_opt);
std::ostream& operator<<(std::ostream& t_out, AddressOption const& t_opt);

}  // namespace updlink
