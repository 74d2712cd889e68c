#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace piecework::util {

/*
  Fixed-point decimal with four fractional digits.

  Quantities, rates and settled pay all use this type; binary floating point
  never touches a persisted amount. Products and quotients are computed on a
  128-bit intermediate and rounded half-up (away from zero) to the requested
  number of places, which is how currency amounts reach their minor unit.
*/
class Decimal {
 public:
  static constexpr int          kScale       = 4;
  static constexpr std::int64_t kUnitsPerOne = 10000;

  constexpr Decimal() = default;

  static constexpr Decimal FromUnits(std::int64_t units) {
    Decimal d;
    d.units_ = units;
    return d;
  }

  static Decimal FromInt(std::int64_t whole);

  // Accepts [+-]digits[.digits]; at most kScale significant fractional digits.
  static std::optional<Decimal> TryParse(std::string_view text);
  // Throws util::Validation on malformed input.
  static Decimal Parse(std::string_view text);

  // a * b rounded half-up to `places` fractional digits (0..kScale).
  static Decimal Multiply(Decimal a, Decimal b, int places);
  // a / b rounded half-up to `places` fractional digits. Throws Validation on b == 0.
  static Decimal Divide(Decimal a, Decimal b, int places);

  Decimal RoundHalfUp(int places) const;

  std::int64_t Units() const {
    return units_;
  }
  bool IsZero() const {
    return units_ == 0;
  }
  bool IsNegative() const {
    return units_ < 0;
  }

  // Shortest exact form: "333.5", "12", "-0.25".
  std::string ToString() const;
  // Fixed number of fractional digits, rounded half-up: ToString(2) -> "333.50".
  std::string ToString(int places) const;

  Decimal operator-() const {
    return FromUnits(-units_);
  }
  Decimal& operator+=(Decimal other);
  Decimal& operator-=(Decimal other);

  friend Decimal operator+(Decimal a, Decimal b) {
    return a += b;
  }
  friend Decimal operator-(Decimal a, Decimal b) {
    return a -= b;
  }

  friend constexpr bool operator==(const Decimal&, const Decimal&)  = default;
  friend constexpr auto operator<=>(const Decimal&, const Decimal&) = default;

 private:
  std::int64_t units_ = 0;
};

Decimal Max(Decimal a, Decimal b);

} // namespace piecework::util
