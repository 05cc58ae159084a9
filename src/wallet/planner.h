#pragma once
// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"
#include "ledger/client.h"
#include "primitives/amount.h"
#include "primitives/fees.h"
#include "primitives/utxo.h"
#include "wallet/assemble.h"
#include "wallet/coin_select.h"
#include "wallet/options.h"
#include "wallet/utxo_lock.h"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wallet {

/// Outcome of a broadcast payment or consolidation.
struct SendResult {
    core::uint256 txid;
    TxPlan plan;
    /// How many lock conflicts were absorbed by re-selection (0 or 1).
    int retries = 0;
};

/// What a payment would cost against the current inventory.
struct FeeEstimate {
    /// Total fee, including any leftover that would be folded into it.
    primitives::Amount fee;
    /// True when the payment can be made without a change output.
    bool can_avoid_change = false;
    size_t num_inputs = 0;
};

/// Check @p amount against the configured payment bounds.
core::Result<void> validate_payment_amount(primitives::Amount amount,
                                           const PlannerOptions& options);

/// Parse a user-supplied decimal amount and check it against the bounds.
core::Result<primitives::Amount> parse_payment_amount(
    std::string_view text, const PlannerOptions& options);

// ---------------------------------------------------------------------------
// PaymentPlanner -- public entry point of the engine
// ---------------------------------------------------------------------------
// Ties inventory, selection, assembly and locking to one ledger node. The
// planner holds no state of its own between calls; any number of threads
// may use one instance, and several planners may share one lock table.
//
// send() / consolidate() flow:
//   inventory -> select -> plan -> lock (table + node) -> verify inputs
//   -> create -> sign -> broadcast -> release
// A lock conflict (including an input spent since the snapshot) triggers
// exactly one re-selection against a fresh inventory. Signing and broadcast
// failures are never retried.
// ---------------------------------------------------------------------------

class PaymentPlanner {
public:
    using PlanOutcome = core::Result<TxPlan, SelectionFailure>;
    using SendOutcome = core::Result<SendResult, SelectionFailure>;

    PaymentPlanner(ledger::LedgerClient& ledger, UtxoLockTable& locks,
                   PlannerOptions options = {});

    [[nodiscard]] const PlannerOptions& options() const { return options_; }

    /// Plan a payment without locking or broadcasting anything.
    /// @param fee_rate  Overrides the configured rate when set.
    PlanOutcome select_and_plan(
        const std::vector<std::string>& addresses,
        const std::string& destination,
        primitives::Amount amount,
        std::optional<primitives::FeeRate> fee_rate = std::nullopt);

    /// Plan a consolidation of the small outputs of @p addresses.
    PlanOutcome plan_consolidation(const std::vector<std::string>& addresses,
                                   const std::string& destination);

    /// Plan, lock, sign and broadcast a payment.
    SendOutcome send(const std::vector<std::string>& addresses,
                     const TargetPayment& payment);

    /// Plan, lock, sign and broadcast a consolidation.
    SendOutcome consolidate(const std::vector<std::string>& addresses,
                            const std::string& destination);

    /// Fee of paying @p amount now, and whether change could be avoided.
    core::Result<FeeEstimate, SelectionFailure> estimate_fee(
        const std::vector<std::string>& addresses,
        primitives::Amount amount);

private:
    using PlanBuilder =
        std::function<PlanOutcome(const std::vector<primitives::Utxo>&)>;

    core::Result<std::vector<primitives::Utxo>, SelectionFailure>
    load(const std::vector<std::string>& addresses, int min_conf);

    PlanOutcome plan_payment(const std::vector<primitives::Utxo>& inventory,
                             const TargetPayment& payment,
                             const FeeModel& fee_model);

    /// Take table and node locks for every input of @p plan and check each
    /// input is still unspent. Conflicts are reported as UTXO_LOCK_CONFLICT.
    core::Result<ScopedUtxoLock, SelectionFailure> lock_inputs(
        const TxPlan& plan);

    SendOutcome execute_with_retry(const std::vector<std::string>& addresses,
                                   const PlanBuilder& build);

    SendOutcome sign_and_broadcast(const TxPlan& plan, ScopedUtxoLock& lock);

    ledger::LedgerClient& ledger_;
    UtxoLockTable& locks_;
    PlannerOptions options_;
};

} // namespace wallet
