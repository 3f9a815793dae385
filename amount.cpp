#include "amount.hpp"

#include <iomanip>
#include <limits>
#include <ostream>
#include <sstream>

namespace payments {

std::optional<Amount> Amount::parse(std::string_view text) {
  bool negative = false;
  if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  const std::size_t dot = text.find('.');
  std::string_view integer_part = text.substr(0, dot);
  std::string_view fraction_part =
      dot == std::string_view::npos ? std::string_view() : text.substr(dot + 1);

  if (integer_part.empty() && fraction_part.empty()) {
    return std::nullopt;
  }
  if (fraction_part.size() > static_cast<std::size_t>(kScaleDigits)) {
    return std::nullopt;
  }

  constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();

  std::int64_t whole = 0;
  for (char c : integer_part) {
    if (c < '0' || c > '9') return std::nullopt;
    const int digit = c - '0';
    if (whole > (kMax / kScale - digit) / 10) {
      return std::nullopt;
    }
    whole = whole * 10 + digit;
  }

  std::int64_t fraction = 0;
  std::int64_t place = kScale;
  for (char c : fraction_part) {
    if (c < '0' || c > '9') return std::nullopt;
    place /= 10;
    fraction += (c - '0') * place;
  }

  if (whole == kMax / kScale && fraction > kMax % kScale) {
    return std::nullopt;
  }

  const std::int64_t units = whole * kScale + fraction;
  return Amount(negative ? -units : units);
}

std::string Amount::toString() const {
  // Magnitude via unsigned arithmetic so the minimum value stays representable.
  const bool negative = units_ < 0;
  const std::uint64_t magnitude = negative ? 0 - static_cast<std::uint64_t>(units_)
                                           : static_cast<std::uint64_t>(units_);
  const std::uint64_t scale = static_cast<std::uint64_t>(kScale);

  std::stringstream ss;
  if (negative) ss << '-';
  ss << magnitude / scale << '.' << std::setw(kScaleDigits) << std::setfill('0')
     << magnitude % scale;
  return ss.str();
}

std::ostream& operator<<(std::ostream& os, Amount amount) {
  return os << amount.toString();
}

}  // namespace payments
