#pragma once
// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/amount.h"
#include "primitives/fees.h"

#include <cstddef>

namespace wallet {

// ---------------------------------------------------------------------------
// Transaction shape -> size -> fee
// ---------------------------------------------------------------------------
// Sizes use legacy pay-to-pubkey-hash weights:
//   per input   148 bytes (outpoint 36, scriptSig ~107, sequence 4, len 1)
//   per output   34 bytes (amount 8, script len 1, script 25)
//   overhead     10 bytes (version 4, locktime 4, vin/vout counts)
// ---------------------------------------------------------------------------

inline constexpr size_t TX_BYTES_PER_INPUT  = 148;
inline constexpr size_t TX_BYTES_PER_OUTPUT = 34;
inline constexpr size_t TX_BYTES_OVERHEAD   = 10;

/// Default fee floor: 0.001 coin.
inline constexpr primitives::Amount DEFAULT_MIN_FEE{primitives::Amount::COIN / 1000};

/// Estimated serialized size of a transaction with the given shape.
[[nodiscard]] size_t estimate_tx_size(size_t num_inputs, size_t num_outputs);

/// max(ceil(rate * size / 1000), min_fee) for the given shape.
[[nodiscard]] primitives::Amount estimate_fee(size_t num_inputs,
                                              size_t num_outputs,
                                              const primitives::FeeRate& rate,
                                              primitives::Amount min_fee);

// ---------------------------------------------------------------------------
// FeeModel -- a fee rate together with its absolute floor
// ---------------------------------------------------------------------------

struct FeeModel {
    primitives::FeeRate rate = primitives::DEFAULT_FEE_RATE;
    primitives::Amount min_fee = DEFAULT_MIN_FEE;

    /// Fee for a transaction with the given input and output counts.
    /// Monotone non-decreasing in both arguments.
    [[nodiscard]] primitives::Amount fee(size_t num_inputs,
                                         size_t num_outputs) const {
        return estimate_fee(num_inputs, num_outputs, rate, min_fee);
    }
};

} // namespace wallet
