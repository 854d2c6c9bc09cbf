#include "trade_recon/core/fixed_decimal.h"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace trade_recon {
namespace {

using URaw = unsigned __int128;

URaw Magnitude(Decimal::Raw value) {
    return value < 0 ? static_cast<URaw>(0) - static_cast<URaw>(value) : static_cast<URaw>(value);
}

Decimal::Raw ApplySign(URaw magnitude, bool negative) {
    const auto value = static_cast<Decimal::Raw>(magnitude);
    return negative ? -value : value;
}

std::string FormatUnsigned(URaw value) {
    if (value == 0) {
        return "0";
    }
    std::string digits;
    while (value > 0) {
        digits.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

}  // namespace

Decimal::Raw FixedDecimal::Pow10(int exponent) {
    Decimal::Raw value = 1;
    for (int i = 0; i < exponent; ++i) {
        value *= 10;
    }
    return value;
}

Decimal::Raw FixedDecimal::Rescale(Decimal::Raw scaled_value,
                                   int from_scale,
                                   int to_scale,
                                   FixedRoundingMode mode) {
    const int safe_from = std::max(0, from_scale);
    const int safe_to = std::max(0, to_scale);
    if (safe_from == safe_to) {
        return scaled_value;
    }
    if (safe_to > safe_from) {
        return scaled_value * Pow10(safe_to - safe_from);
    }

    const Decimal::Raw divisor = Pow10(safe_from - safe_to);
    Decimal::Raw quotient = scaled_value / divisor;
    const Decimal::Raw remainder = scaled_value % divisor;
    if (remainder == 0) {
        return quotient;
    }
    switch (mode) {
        case FixedRoundingMode::kDown:
            if (scaled_value < 0) {
                --quotient;
            }
            break;
        case FixedRoundingMode::kUp:
            if (scaled_value > 0) {
                ++quotient;
            }
            break;
        case FixedRoundingMode::kHalfUp:
        default:
            if (Magnitude(remainder) * 2 >= static_cast<URaw>(divisor)) {
                quotient += scaled_value < 0 ? -1 : 1;
            }
            break;
    }
    return quotient;
}

Decimal Decimal::FromInt(std::int64_t value) {
    return Decimal(static_cast<Raw>(value) * FixedDecimal::Pow10(kScale));
}

bool Decimal::Parse(const std::string& text, Decimal* out, std::string* error) {
    if (out == nullptr) {
        if (error != nullptr) {
            *error = "decimal output pointer is null";
        }
        return false;
    }
    std::size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }

    URaw integer_part = 0;
    int integer_digits = 0;
    int significant_integer_digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
        const int digit = text[pos] - '0';
        if (significant_integer_digits > 0 || digit != 0) {
            ++significant_integer_digits;
        }
        if (significant_integer_digits > kMaxIntegerDigits) {
            if (error != nullptr) {
                *error = "decimal literal out of range: " + text;
            }
            return false;
        }
        integer_part = integer_part * 10 + static_cast<URaw>(digit);
        ++integer_digits;
        ++pos;
    }

    URaw fraction_part = 0;
    int fraction_digits = 0;
    bool round_up = false;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            const int digit = text[pos] - '0';
            if (fraction_digits < kScale) {
                fraction_part = fraction_part * 10 + static_cast<URaw>(digit);
            } else if (fraction_digits == kScale) {
                round_up = digit >= 5;
            }
            ++fraction_digits;
            ++pos;
        }
    }

    if (pos != text.size() || (integer_digits == 0 && fraction_digits == 0)) {
        if (error != nullptr) {
            *error = "invalid decimal literal: '" + text + "'";
        }
        return false;
    }

    for (int i = std::min(fraction_digits, kScale); i < kScale; ++i) {
        fraction_part *= 10;
    }
    URaw magnitude =
        integer_part * static_cast<URaw>(FixedDecimal::Pow10(kScale)) + fraction_part;
    if (round_up) {
        ++magnitude;
    }
    *out = Decimal(ApplySign(magnitude, negative));
    return true;
}

Decimal Decimal::Round(int fraction_digits, FixedRoundingMode mode) const {
    if (fraction_digits >= kScale) {
        return *this;
    }
    const int digits = std::max(0, fraction_digits);
    const Raw rounded = FixedDecimal::Rescale(scaled_, kScale, digits, mode);
    return Decimal(rounded * FixedDecimal::Pow10(kScale - digits));
}

Decimal Decimal::Abs() const {
    return Decimal(scaled_ < 0 ? -scaled_ : scaled_);
}

bool Decimal::IsInteger() const {
    return scaled_ % FixedDecimal::Pow10(kScale) == 0;
}

bool Decimal::TryToInt64(std::int64_t* out) const {
    const Raw integral = scaled_ / FixedDecimal::Pow10(kScale);
    if (integral < std::numeric_limits<std::int64_t>::min() ||
        integral > std::numeric_limits<std::int64_t>::max()) {
        return false;
    }
    if (out != nullptr) {
        *out = static_cast<std::int64_t>(integral);
    }
    return true;
}

std::int64_t Decimal::ToInt64() const {
    std::int64_t value = 0;
    if (!TryToInt64(&value)) {
        throw std::overflow_error("decimal out of int64 range: " + ToString());
    }
    return value;
}

std::string Decimal::ToString(int fraction_digits) const {
    const int digits = std::max(0, fraction_digits);
    const Raw rounded = FixedDecimal::Rescale(scaled_, kScale, digits, FixedRoundingMode::kHalfUp);
    const URaw magnitude = Magnitude(rounded);
    const auto unit = static_cast<URaw>(FixedDecimal::Pow10(digits));

    std::string text = rounded < 0 ? "-" : "";
    text += FormatUnsigned(magnitude / unit);
    if (digits > 0) {
        std::string fraction = FormatUnsigned(magnitude % unit);
        text.push_back('.');
        text.append(static_cast<std::size_t>(digits) - fraction.size(), '0');
        text += fraction;
    }
    return text;
}

std::string Decimal::ToString() const {
    std::string text = ToString(kScale);
    const auto dot = text.find('.');
    if (dot == std::string::npos) {
        return text;
    }
    std::size_t end = text.size();
    while (end > dot + 1 && text[end - 1] == '0') {
        --end;
    }
    if (end == dot + 1) {
        end = dot;
    }
    return text.substr(0, end);
}

Decimal Decimal::operator*(const Decimal& other) const {
    const bool negative = (scaled_ < 0) != (other.scaled_ < 0);
    const auto unit = static_cast<URaw>(FixedDecimal::Pow10(kScale));
    const URaw lhs = Magnitude(scaled_);
    const URaw rhs = Magnitude(other.scaled_);

    // (lq*S + lr) * (rq*S + rr) / S, split so that no partial product exceeds the value range.
    const URaw lq = lhs / unit;
    const URaw lr = lhs % unit;
    const URaw rq = rhs / unit;
    const URaw rr = rhs % unit;
    const auto limit = static_cast<URaw>(FixedDecimal::Pow10(kMaxIntegerDigits));
    if (lq != 0 && rq > limit / lq) {
        throw std::overflow_error("decimal multiplication overflow");
    }
    const URaw low = lr * rr;
    const URaw cross = lq * rr + lr * rq + low / unit;
    const URaw integral = lq * rq + cross / unit;
    if (integral >= limit) {
        throw std::overflow_error("decimal multiplication overflow");
    }
    URaw magnitude = integral * unit + cross % unit;
    if ((low % unit) * 2 >= unit) {
        ++magnitude;
    }
    return Decimal(ApplySign(magnitude, negative));
}

Decimal Decimal::operator/(const Decimal& other) const {
    if (other.scaled_ == 0) {
        throw std::domain_error("decimal division by zero");
    }
    const bool negative = (scaled_ < 0) != (other.scaled_ < 0);
    const URaw dividend = Magnitude(scaled_);
    const URaw divisor = Magnitude(other.scaled_);

    URaw quotient = dividend / divisor;
    URaw remainder = dividend % divisor;
    for (int i = 0; i < kScale; ++i) {
        remainder *= 10;
        quotient = quotient * 10 + remainder / divisor;
        remainder %= divisor;
    }
    if (remainder * 2 >= divisor) {
        ++quotient;
    }
    return Decimal(ApplySign(quotient, negative));
}

}  // namespace trade_recon
