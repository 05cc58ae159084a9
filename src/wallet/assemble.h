#pragma once
// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "primitives/amount.h"
#include "primitives/outpoint.h"
#include "wallet/coin_select.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace wallet {

// ---------------------------------------------------------------------------
// TargetPayment -- one single-recipient payment request
// ---------------------------------------------------------------------------

struct TargetPayment {
    std::string destination;
    primitives::Amount amount;
    /// Upper bound on the plan's fee (including any folded leftover).
    std::optional<primitives::Amount> max_fee;
};

// ---------------------------------------------------------------------------
// TxPlan -- what to ask the node to build, sign and broadcast
// ---------------------------------------------------------------------------
// Invariant: sum(outputs) + fee == input_total, and no output is below the
// dust threshold it was built with.
// ---------------------------------------------------------------------------

struct TxPlan {
    std::vector<primitives::OutPoint> inputs;
    primitives::Amount input_total;
    std::map<std::string, primitives::Amount> outputs;
    primitives::Amount fee;
    std::optional<std::string> change_address;

    [[nodiscard]] primitives::Amount output_total() const;
};

/// True when @p selection requires a change output, i.e. the caller must
/// obtain a change address before calling build_plan().
[[nodiscard]] bool needs_change_output(const SelectionResult& selection,
                                       primitives::Amount dust_threshold);

/// Turn a selection into a plan:
///   - exactly one output of payment.amount to payment.destination;
///   - a change output of exactly selection.leftover to @p change_address
///     when the selection permits change and the leftover is not dust;
///   - otherwise the leftover is folded into the fee.
/// The change address must differ from the destination.
core::Result<TxPlan> build_plan(const SelectionResult& selection,
                                const TargetPayment& payment,
                                primitives::Amount dust_threshold,
                                const std::string& change_address = {});

/// Re-check every plan invariant (balance, dust, no duplicate inputs).
core::Result<void> validate_plan(const TxPlan& plan,
                                 primitives::Amount dust_threshold);

} // namespace wallet
