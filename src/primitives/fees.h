#pragma once
// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/amount.h"

#include <compare>
#include <cstddef>
#include <cstdint>
#include <string>

namespace primitives {

// ---------------------------------------------------------------------------
// FeeRate  --  fee expressed as base-units per 1000 bytes
// ---------------------------------------------------------------------------

struct FeeRate {
    /// Fee per 1000 bytes (1 kB) of serialized transaction.
    Amount fee_per_kb;

    /// Default: zero fee rate.
    FeeRate() : fee_per_kb(Amount(0)) {}

    /// Construct from an explicit fee-per-kB value.
    explicit FeeRate(Amount fee_per_kb_in)
        : fee_per_kb(fee_per_kb_in) {}

    /// Compute the fee for a transaction of the given size, rounded up so
    /// integer truncation never undercharges. Saturates at MAX_MONEY.
    ///
    /// @param size  Serialized size of the transaction in bytes.
    /// @returns The computed fee in base units.
    [[nodiscard]] Amount compute_fee(size_t size) const;

    /// Human-readable representation: "<coins>/kB".
    [[nodiscard]] std::string to_string() const;

    bool operator==(const FeeRate& other) const {
        return fee_per_kb == other.fee_per_kb;
    }
    auto operator<=>(const FeeRate& other) const {
        return fee_per_kb <=> other.fee_per_kb;
    }
};

/// Default payment fee rate: 0.01 coin per kB.
inline const FeeRate DEFAULT_FEE_RATE{Amount(Amount::COIN / 100)};

} // namespace primitives
