#include "internal/util/decimal.hpp"

#include <limits>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace piecework::util {

namespace {

using Wide = __int128;

constexpr std::int64_t kPow10[] = {1, 10, 100, 1000, 10000, 100000, 1000000, 10000000, 100000000};

void CheckPlaces(int places) {
  if (places < 0 || places > Decimal::kScale) {
    throw std::invalid_argument("decimal places out of range: " + std::to_string(places));
  }
}

// Integer division rounding half away from zero.
Wide RoundDiv(Wide num, Wide den) {
  if (den < 0) {
    num = -num;
    den = -den;
  }
  Wide q = num / den;
  Wide r = num % den;
  if (r < 0) {
    r = -r;
  }
  if (2 * r >= den) {
    q += (num < 0) ? -1 : 1;
  }
  return q;
}

std::int64_t Narrow(Wide v, const char* what) {
  if (v > std::numeric_limits<std::int64_t>::max() || v < std::numeric_limits<std::int64_t>::min()) {
    throw std::overflow_error(std::string("decimal overflow in ") + what);
  }
  return static_cast<std::int64_t>(v);
}

} // namespace

Decimal Decimal::FromInt(std::int64_t whole) {
  return FromUnits(Narrow(static_cast<Wide>(whole) * kUnitsPerOne, "FromInt"));
}

std::optional<Decimal> Decimal::TryParse(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  bool        negative = false;
  std::size_t pos      = 0;
  if (text[0] == '+' || text[0] == '-') {
    negative = text[0] == '-';
    pos      = 1;
  }

  Wide whole       = 0;
  Wide frac        = 0;
  int  frac_digits = 0;
  bool seen_digit  = false;
  bool seen_point  = false;

  for (; pos < text.size(); ++pos) {
    const char c = text[pos];
    if (c == '.') {
      if (seen_point) {
        return std::nullopt;
      }
      seen_point = true;
      continue;
    }
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    seen_digit = true;
    const int digit = c - '0';
    if (!seen_point) {
      whole = whole * 10 + digit;
      if (whole > std::numeric_limits<std::int64_t>::max() / kUnitsPerOne) {
        return std::nullopt;
      }
    } else if (frac_digits < kScale) {
      frac = frac * 10 + digit;
      ++frac_digits;
    } else if (digit != 0) {
      // more precision than we can hold
      return std::nullopt;
    }
  }

  if (!seen_digit) {
    return std::nullopt;
  }

  Wide units = whole * kUnitsPerOne + frac * kPow10[kScale - frac_digits];
  if (negative) {
    units = -units;
  }
  // whole alone can fit while whole + frac does not
  if (units > std::numeric_limits<std::int64_t>::max() || units < std::numeric_limits<std::int64_t>::min()) {
    return std::nullopt;
  }
  return FromUnits(static_cast<std::int64_t>(units));
}

Decimal Decimal::Parse(std::string_view text) {
  auto parsed = TryParse(text);
  if (!parsed) {
    throw Validation("invalid decimal value: '" + std::string(text) + "'");
  }
  return *parsed;
}

Decimal Decimal::Multiply(Decimal a, Decimal b, int places) {
  CheckPlaces(places);
  // product carries 2*kScale fractional digits
  const Wide product = static_cast<Wide>(a.units_) * static_cast<Wide>(b.units_);
  const Wide rounded = RoundDiv(product, kPow10[2 * kScale - places]);
  return FromUnits(Narrow(rounded * kPow10[kScale - places], "Multiply"));
}

Decimal Decimal::Divide(Decimal a, Decimal b, int places) {
  CheckPlaces(places);
  if (b.units_ == 0) {
    throw Validation("division by zero");
  }
  const Wide rounded = RoundDiv(static_cast<Wide>(a.units_) * kPow10[places], b.units_);
  return FromUnits(Narrow(rounded * kPow10[kScale - places], "Divide"));
}

Decimal Decimal::RoundHalfUp(int places) const {
  CheckPlaces(places);
  const Wide step = kPow10[kScale - places];
  return FromUnits(Narrow(RoundDiv(units_, step) * step, "RoundHalfUp"));
}

std::string Decimal::ToString() const {
  std::string out = ToString(kScale);
  const auto  dot = out.find('.');
  if (dot == std::string::npos) {
    return out;
  }
  while (out.back() == '0') {
    out.pop_back();
  }
  if (out.back() == '.') {
    out.pop_back();
  }
  return out;
}

std::string Decimal::ToString(int places) const {
  CheckPlaces(places);
  const Wide rounded = RoundDiv(units_, kPow10[kScale - places]);
  const bool negative = rounded < 0;
  const Wide magnitude = negative ? -rounded : rounded;

  const Wide whole = magnitude / kPow10[places];
  Wide       frac  = magnitude % kPow10[places];

  std::string out = negative ? "-" : "";
  out += std::to_string(static_cast<std::int64_t>(whole));
  if (places > 0) {
    std::string digits(static_cast<std::size_t>(places), '0');
    for (int i = places - 1; i >= 0; --i) {
      digits[static_cast<std::size_t>(i)] = static_cast<char>('0' + static_cast<int>(frac % 10));
      frac /= 10;
    }
    out += '.';
    out += digits;
  }
  return out;
}

Decimal& Decimal::operator+=(Decimal other) {
  if (__builtin_add_overflow(units_, other.units_, &units_)) {
    throw std::overflow_error("decimal overflow in addition");
  }
  return *this;
}

Decimal& Decimal::operator-=(Decimal other) {
  if (__builtin_sub_overflow(units_, other.units_, &units_)) {
    throw std::overflow_error("decimal overflow in subtraction");
  }
  return *this;
}

Decimal Max(Decimal a, Decimal b) {
  return a < b ? b : a;
}

} // namespace piecework::util
