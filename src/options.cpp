#include "upd_mkimg/options.hpp"
#include <charconv>
#include <fmt/format.h>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>

namespace {

template <typename T>
bool parse_unsigned(std::string_view t_token, T& t_value, int const t_base) {
  if (t_token.empty()) {
    return false;
  }

  auto const* const last = t_token.data() + t_token.size();
  auto const [ptr, ec]   = std::from_chars(t_token.data(), last, t_value, t_base);
  return ec == std::errc{} and ptr == last;
}

}  // namespace

namespace updlink {

std::istream& operator>>(std::istream& t_in, ByteOption& t_opt) {
  std::string token;
  t_in >> token;

  unsigned value = 0;
  if (parse_unsigned(token, value, 10) and value <= std::numeric_limits<std::uint8_t>::max()) {
    t_opt.value_ = static_cast<std::uint8_t>(value);
  } else {
    t_in.setstate(std::ios_base::failbit);
  }

  return t_in;
}

std::ostream& operator<<(std::ostream& t_out, ByteOption const& t_opt) {
  return t_out << static_cast<unsigned>(t_opt.value_);
}

std::istream& operator>>(std::istream& t_in, AddressOption& t_opt) {
  std::string token;
  t_in >> token;

  std::string_view view{token};
  auto base = 10;
  if (view.starts_with("0x") or view.starts_with("0X")) {
    view.remove_prefix(2);
    base = 16;
  }

  // no octal, a leading zero is only allowed when the number is zero
  auto const leading_zero = base == 10 and view.size() > 1 and view.front() == '0' and
                            view.find_first_not_of('0') != std::string_view::npos;

  std::uint32_t value = 0;
  if (not leading_zero and parse_unsigned(view, value, base)) {
    t_opt.value_ = value;
  } else {
    t_in.setstate(std::ios_base::failbit);
  }

  return t_in;
}

std::ostream& operator<<(std::ostream& t_out, AddressOption const& t_opt) {
  return t_out << fmt::format("{:#06x}", t_opt.value_);
}

}  // namespace updlink
