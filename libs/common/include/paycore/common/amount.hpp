#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace paycore {
namespace common {

// Exact decimal with four fractional digits, stored as a count of 1/10'000 units.
class Amount {
 public:
  static constexpr int kFractionDigits = 4;
  static constexpr std::int64_t kScale = 10'000;

  constexpr Amount() noexcept = default;

  [[nodiscard]] static constexpr Amount from_units(std::int64_t units) noexcept {
    Amount amount;
    amount.units_ = units;
    return amount;
  }

  [[nodiscard]] static constexpr Amount zero() noexcept { return Amount{}; }

  // Accepts [+-]digits[.digits] with at most kFractionDigits after the point.
  [[nodiscard]] static std::optional<Amount> parse(std::string_view text);

  [[nodiscard]] static std::optional<Amount> checked_add(Amount lhs, Amount rhs) noexcept;

  [[nodiscard]] constexpr std::int64_t units() const noexcept { return units_; }
  [[nodiscard]] constexpr bool is_negative() const noexcept { return units_ < 0; }
  [[nodiscard]] constexpr bool is_zero() const noexcept { return units_ == 0; }

  [[nodiscard]] std::string to_string(bool trim_trailing_zeros = false) const;

  constexpr Amount& operator+=(Amount rhs) noexcept {
    units_ += rhs.units_;
    return *this;
  }

  constexpr Amount& operator-=(Amount rhs) noexcept {
    units_ -= rhs.units_;
    return *this;
  }

  friend constexpr Amount operator+(Amount lhs, Amount rhs) noexcept { return lhs += rhs; }
  friend constexpr Amount operator-(Amount lhs, Amount rhs) noexcept { return lhs -= rhs; }
  friend constexpr Amount operator-(Amount value) noexcept { return from_units(-value.units_); }

  friend constexpr bool operator==(Amount, Amount) noexcept = default;
  friend constexpr auto operator<=>(Amount, Amount) noexcept = default;

 private:
  std::int64_t units_{0};
};

}  // namespace common
}  // namespace paycore
