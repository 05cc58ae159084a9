#pragma once
// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/config.h"
#include "core/error.h"
#include "primitives/amount.h"
#include "wallet/fee_model.h"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace wallet {

// ---------------------------------------------------------------------------
// Defaults
// ---------------------------------------------------------------------------

/// Outputs below 0.001 coin are never created.
inline constexpr primitives::Amount DEFAULT_DUST_THRESHOLD{primitives::Amount::COIN / 1000};

/// A change-free match may overpay the fee by up to 0.01 coin.
inline constexpr primitives::Amount DEFAULT_MAX_OVERPAY{primitives::Amount::COIN / 100};

inline constexpr int DEFAULT_MIN_CONFIRMATIONS = 1;

/// Planner locks are considered abandoned after this many seconds.
inline constexpr int64_t DEFAULT_LOCK_TIMEOUT = 60;

inline constexpr primitives::Amount DEFAULT_CONSOLIDATE_THRESHOLD{primitives::Amount::COIN};
inline constexpr size_t DEFAULT_CONSOLIDATE_MAX_INPUTS = 100;

inline constexpr primitives::Amount DEFAULT_MIN_PAYMENT{primitives::Amount::COIN / 100};
inline constexpr primitives::Amount DEFAULT_MAX_PAYMENT{1'000'000 * primitives::Amount::COIN};

// ---------------------------------------------------------------------------
// PlannerOptions -- every tunable of the payment planner
// ---------------------------------------------------------------------------

struct PlannerOptions {
    FeeModel fee_model;
    primitives::Amount dust_threshold = DEFAULT_DUST_THRESHOLD;
    primitives::Amount max_overpay = DEFAULT_MAX_OVERPAY;
    /// Absolute fee cap applied to every plan; unset means no cap.
    std::optional<primitives::Amount> max_fee;
    int min_confirmations = DEFAULT_MIN_CONFIRMATIONS;
    int64_t lock_timeout = DEFAULT_LOCK_TIMEOUT;
    primitives::Amount consolidate_threshold = DEFAULT_CONSOLIDATE_THRESHOLD;
    size_t consolidate_max_inputs = DEFAULT_CONSOLIDATE_MAX_INPUTS;
    primitives::Amount min_payment = DEFAULT_MIN_PAYMENT;
    primitives::Amount max_payment = DEFAULT_MAX_PAYMENT;

    /// Read options from @p config; keys that are absent keep their
    /// defaults. Amount keys take decimal coin strings.
    static core::Result<PlannerOptions> from_config(const core::Config& config);

    /// Reject inconsistent combinations (e.g. a dust threshold above the
    /// minimum payment).
    [[nodiscard]] core::Result<void> validate() const;
};

} // namespace wallet
