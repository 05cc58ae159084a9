#pragma once
// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

#include "core/error.h"

namespace primitives {

/// Represents a monetary amount in base units (the smallest ledger unit).
/// One coin equals 100,000,000 base units. All money arithmetic in txplan is
/// integer arithmetic on this type.
class Amount {
    int64_t value_ = 0;

public:
    /// Number of base units per coin.
    static constexpr int64_t COIN = 100'000'000;

    /// Number of fractional decimal digits in a coin amount.
    static constexpr int DECIMALS = 8;

    /// Maximum total supply in base units (21 million coins).
    static constexpr int64_t MAX_MONEY = 21'000'000 * COIN;

    /// Default-construct a zero amount.
    constexpr Amount() = default;

    /// Construct from a raw base-unit value. No validation is performed;
    /// prefer from_value() when the source is untrusted.
    constexpr explicit Amount(int64_t v) : value_(v) {}

    /// Construct an Amount after validating that v is within [0, MAX_MONEY].
    static core::Result<Amount> from_value(int64_t v);

    /// Parse a decimal coin string ("12", "0.5", "1.00000001") into base
    /// units without going through floating point. At most DECIMALS
    /// fractional digits; no sign, exponent or thousands separators.
    static core::Result<Amount> parse(std::string_view text);

    /// Return the raw base-unit value.
    [[nodiscard]] constexpr int64_t value() const { return value_; }

    /// Render as a fixed-point coin string with all DECIMALS digits,
    /// e.g. "12.34500000". Negative values get a leading '-'.
    [[nodiscard]] std::string to_string() const;

    /// Checked addition. Returns an error on overflow or if the result
    /// falls outside the valid money range.
    [[nodiscard]] core::Result<Amount> operator+(Amount other) const;

    /// Checked subtraction. Returns an error on underflow or if the result
    /// falls outside the valid money range.
    [[nodiscard]] core::Result<Amount> operator-(Amount other) const;

    /// In-place addition. Callers must ensure the result stays in range.
    Amount& operator+=(Amount other);

    /// In-place subtraction. Callers must ensure the result stays in range.
    Amount& operator-=(Amount other);

    constexpr bool operator==(const Amount& o) const = default;
    constexpr auto operator<=>(const Amount& o) const = default;

    /// Returns true when the value is within the valid range [0, MAX_MONEY].
    [[nodiscard]] constexpr bool is_valid() const {
        return value_ >= 0 && value_ <= MAX_MONEY;
    }
};

/// A convenient constant representing a zero amount.
inline constexpr Amount ZERO_AMOUNT{0};

} // namespace primitives
