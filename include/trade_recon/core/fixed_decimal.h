#pragma once

#include <cstdint>
#include <string>

namespace trade_recon {

enum class FixedRoundingMode {
    kHalfUp = 0,
    kDown = 1,
    kUp = 2,
};

// Signed fixed-point decimal backed by a 128-bit integer scaled by 10^12.
// Sums and products are exact; quotients round half-up at the 12th fractional digit.
// A product with more than kMaxIntegerDigits integer digits throws std::overflow_error.
class Decimal {
public:
    using Raw = __int128;

    static constexpr int kScale = 12;
    static constexpr int kMaxIntegerDigits = 26;

    Decimal() = default;

    static Decimal FromInt(std::int64_t value);
    static Decimal FromScaled(Raw scaled_value) { return Decimal(scaled_value); }

    // Accepts [+-]digits[.digits]. Fraction digits beyond kScale are rounded half-up.
    static bool Parse(const std::string& text, Decimal* out, std::string* error);

    Raw scaled() const { return scaled_; }

    Decimal Round(int fraction_digits, FixedRoundingMode mode = FixedRoundingMode::kHalfUp) const;
    Decimal Abs() const;
    bool IsZero() const { return scaled_ == 0; }
    bool IsNegative() const { return scaled_ < 0; }
    bool IsInteger() const;
    // Integral part, truncated toward zero. Throws std::overflow_error outside int64 range.
    std::int64_t ToInt64() const;
    bool TryToInt64(std::int64_t* out) const;

    std::string ToString(int fraction_digits) const;
    std::string ToString() const;

    Decimal operator-() const { return Decimal(-scaled_); }
    Decimal operator+(const Decimal& other) const { return Decimal(scaled_ + other.scaled_); }
    Decimal operator-(const Decimal& other) const { return Decimal(scaled_ - other.scaled_); }
    Decimal operator*(const Decimal& other) const;
    Decimal operator/(const Decimal& other) const;
    Decimal& operator+=(const Decimal& other) {
        scaled_ += other.scaled_;
        return *this;
    }
    Decimal& operator-=(const Decimal& other) {
        scaled_ -= other.scaled_;
        return *this;
    }

    bool operator==(const Decimal& other) const { return scaled_ == other.scaled_; }
    bool operator!=(const Decimal& other) const { return scaled_ != other.scaled_; }
    bool operator<(const Decimal& other) const { return scaled_ < other.scaled_; }
    bool operator<=(const Decimal& other) const { return scaled_ <= other.scaled_; }
    bool operator>(const Decimal& other) const { return scaled_ > other.scaled_; }
    bool operator>=(const Decimal& other) const { return scaled_ >= other.scaled_; }

private:
    explicit Decimal(Raw scaled_value) : scaled_(scaled_value) {}

    Raw scaled_{0};
};

// Monetary rounding used for every currency field: 2 fractional digits, half-up.
inline Decimal Round2(const Decimal& value) {
    return value.Round(2, FixedRoundingMode::kHalfUp);
}

class FixedDecimal {
public:
    static Decimal::Raw Pow10(int exponent);
    static Decimal::Raw Rescale(Decimal::Raw scaled_value,
                                int from_scale,
                                int to_scale,
                                FixedRoundingMode mode);
};

}  // namespace trade_recon
