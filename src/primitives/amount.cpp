// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/amount.h"

#include <limits>

namespace primitives {

core::Result<Amount> Amount::from_value(int64_t v) {
    if (v < 0 || v > MAX_MONEY) {
        return core::make_error(
            core::ErrorCode::VALIDATION_RANGE,
            "Amount out of valid range [0, " +
                std::to_string(MAX_MONEY) + "]: " + std::to_string(v));
    }
    return Amount(v);
}

core::Result<Amount> Amount::parse(std::string_view text) {
    if (text.empty()) {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                "Amount string is empty");
    }

    const auto dot = text.find('.');
    std::string_view whole = text.substr(0, dot);
    std::string_view frac = dot == std::string_view::npos
                                ? std::string_view{}
                                : text.substr(dot + 1);

    if (whole.empty() && frac.empty()) {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                "Amount has no digits: '" +
                                std::string(text) + "'");
    }
    if (frac.size() > static_cast<size_t>(DECIMALS)) {
        return core::make_error(
            core::ErrorCode::PARSE_BAD_FORMAT,
            "Too many decimal places (max " + std::to_string(DECIMALS) +
            "): '" + std::string(text) + "'");
    }

    // Whole part is bounded by MAX_MONEY / COIN, so checking the digit
    // count up front keeps the accumulation below free of overflow.
    constexpr size_t MAX_WHOLE_DIGITS = 9;
    if (whole.size() > MAX_WHOLE_DIGITS) {
        return core::make_error(core::ErrorCode::PARSE_OVERFLOW,
                                "Amount too large: '" +
                                std::string(text) + "'");
    }

    int64_t units = 0;
    for (char c : whole) {
        if (c < '0' || c > '9') {
            return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                    "Invalid character in amount: '" +
                                    std::string(text) + "'");
        }
        units = units * 10 + (c - '0');
    }
    units *= COIN;

    int64_t scale = COIN / 10;
    for (char c : frac) {
        if (c < '0' || c > '9') {
            return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                    "Invalid character in amount: '" +
                                    std::string(text) + "'");
        }
        units += (c - '0') * scale;
        scale /= 10;
    }

    if (units > MAX_MONEY) {
        return core::make_error(core::ErrorCode::PARSE_OVERFLOW,
                                "Amount exceeds maximum money supply: '" +
                                std::string(text) + "'");
    }
    return Amount(units);
}

std::string Amount::to_string() const {
    // Work in unsigned space so MIN int64 does not overflow on negation.
    const bool negative = value_ < 0;
    const uint64_t magnitude = negative
        ? static_cast<uint64_t>(-(value_ + 1)) + 1
        : static_cast<uint64_t>(value_);

    std::string frac = std::to_string(magnitude % COIN);
    frac.insert(0, static_cast<size_t>(DECIMALS) - frac.size(), '0');

    std::string out = negative ? "-" : "";
    out += std::to_string(magnitude / COIN);
    out += '.';
    out += frac;
    return out;
}

core::Result<Amount> Amount::operator+(Amount other) const {
    // Check for signed overflow before performing the addition.
    if (other.value_ > 0 &&
        value_ > std::numeric_limits<int64_t>::max() - other.value_) {
        return core::make_error(
            core::ErrorCode::VALIDATION_RANGE,
            "Amount addition overflows int64_t");
    }
    if (other.value_ < 0 &&
        value_ < std::numeric_limits<int64_t>::min() - other.value_) {
        return core::make_error(
            core::ErrorCode::VALIDATION_RANGE,
            "Amount addition underflows int64_t");
    }

    int64_t result = value_ + other.value_;
    if (result < 0 || result > MAX_MONEY) {
        return core::make_error(
            core::ErrorCode::VALIDATION_RANGE,
            "Amount addition result out of valid money range");
    }
    return Amount(result);
}

core::Result<Amount> Amount::operator-(Amount other) const {
    if (other.value_ < 0 &&
        value_ > std::numeric_limits<int64_t>::max() + other.value_) {
        return core::make_error(
            core::ErrorCode::VALIDATION_RANGE,
            "Amount subtraction overflows int64_t");
    }
    if (other.value_ > 0 &&
        value_ < std::numeric_limits<int64_t>::min() + other.value_) {
        return core::make_error(
            core::ErrorCode::VALIDATION_RANGE,
            "Amount subtraction underflows int64_t");
    }

    int64_t result = value_ - other.value_;
    if (result < 0 || result > MAX_MONEY) {
        return core::make_error(
            core::ErrorCode::VALIDATION_RANGE,
            "Amount subtraction result out of valid money range");
    }
    return Amount(result);
}

Amount& Amount::operator+=(Amount other) {
    value_ += other.value_;
    return *this;
}

Amount& Amount::operator-=(Amount other) {
    value_ -= other.value_;
    return *this;
}

} // namespace primitives
