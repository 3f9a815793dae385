#ifndef AMOUNT_HPP_
#define AMOUNT_HPP_

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace payments {

/**
 * Fixed-point monetary amount with exactly four fractional digits.
 * Stored as a signed count of 1/10000 units so that all arithmetic is exact.
 */
class Amount {
 public:
  static constexpr int kScaleDigits = 4;
  static constexpr std::int64_t kScale = 10000;

  constexpr Amount() = default;

  static constexpr Amount fromUnits(std::int64_t units) { return Amount(units); }
  static constexpr Amount zero() { return Amount(0); }

  /**
   * Parses "[+-]digits[.digits]" with at most four fractional digits.
   * Returns nullopt on malformed text or when the value does not fit.
   */
  static std::optional<Amount> parse(std::string_view text);

  // Raw 1/10000 units.
  constexpr std::int64_t units() const { return units_; }

  constexpr bool isNegative() const { return units_ < 0; }

  // Renders with exactly four fractional digits, e.g. "74.5000".
  std::string toString() const;

  constexpr Amount operator+(Amount other) const { return Amount(units_ + other.units_); }
  constexpr Amount operator-(Amount other) const { return Amount(units_ - other.units_); }
  Amount& operator+=(Amount other) {
    units_ += other.units_;
    return *this;
  }
  Amount& operator-=(Amount other) {
    units_ -= other.units_;
    return *this;
  }

  constexpr bool operator==(Amount other) const { return units_ == other.units_; }
  constexpr bool operator!=(Amount other) const { return units_ != other.units_; }
  constexpr bool operator<(Amount other) const { return units_ < other.units_; }
  constexpr bool operator<=(Amount other) const { return units_ <= other.units_; }
  constexpr bool operator>(Amount other) const { return units_ > other.units_; }
  constexpr bool operator>=(Amount other) const { return units_ >= other.units_; }

 private:
  constexpr explicit Amount(std::int64_t units) : units_(units) {}

  std::int64_t units_ = 0;
};

std::ostream& operator<<(std::ostream& os, Amount amount);

}  // namespace payments

#endif  // AMOUNT_HPP_
