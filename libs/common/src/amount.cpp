#include "paycore/common/amount.hpp"

#include <limits>

namespace paycore {
namespace common {

namespace {
constexpr std::int64_t kMaxUnits = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t kMinUnits = std::numeric_limits<std::int64_t>::min();

bool is_digit(char c) noexcept {
  return c >= '0' && c <= '9';
}
}  // namespace

std::optional<Amount> Amount::parse(std::string_view text) {
  bool negative = false;
  if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  const auto dot = text.find('.');
  const std::string_view whole = text.substr(0, dot);
  const std::string_view fraction = dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);

  if (whole.empty() && fraction.empty()) {
    return std::nullopt;
  }
  if (fraction.size() > static_cast<std::size_t>(kFractionDigits)) {
    return std::nullopt;
  }

  std::int64_t integer = 0;
  for (const char c : whole) {
    if (!is_digit(c)) {
      return std::nullopt;
    }
    const std::int64_t digit = c - '0';
    if (integer > (kMaxUnits / kScale - digit) / 10) {
      return std::nullopt;
    }
    integer = integer * 10 + digit;
  }

  std::int64_t fractional = 0;
  std::int64_t place = kScale;
  for (const char c : fraction) {
    if (!is_digit(c)) {
      return std::nullopt;
    }
    place /= 10;
    fractional += (c - '0') * place;
  }

  if (integer > (kMaxUnits - fractional) / kScale) {
    return std::nullopt;
  }
  const std::int64_t units = integer * kScale + fractional;
  return from_units(negative ? -units : units);
}

std::optional<Amount> Amount::checked_add(Amount lhs, Amount rhs) noexcept {
  if ((rhs.units_ > 0 && lhs.units_ > kMaxUnits - rhs.units_) ||
      (rhs.units_ < 0 && lhs.units_ < kMinUnits - rhs.units_)) {
    return std::nullopt;
  }
  return from_units(lhs.units_ + rhs.units_);
}

std::string Amount::to_string(bool trim_trailing_zeros) const {
  const bool negative = units_ < 0;
  const std::uint64_t magnitude = negative ? 0 - static_cast<std::uint64_t>(units_)
                                           : static_cast<std::uint64_t>(units_);
  const auto scale = static_cast<std::uint64_t>(kScale);

  std::string out;
  if (negative) {
    out.push_back('-');
  }
  out += std::to_string(magnitude / scale);

  std::string fraction = std::to_string(magnitude % scale);
  fraction.insert(0, static_cast<std::size_t>(kFractionDigits) - fraction.size(), '0');
  if (trim_trailing_zeros) {
    while (!fraction.empty() && fraction.back() == '0') {
      fraction.pop_back();
    }
  }
  if (!fraction.empty()) {
    out.push_back('.');
    out += fraction;
  }
  return out;
}

}  // namespace common
}  // namespace paycore
