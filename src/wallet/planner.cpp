// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet/planner.h"
#include "core/logging.h"
#include "wallet/consolidate.h"
#include "wallet/inventory.h"

#include <algorithm>
#include <utility>

namespace wallet {

namespace {

/// The stricter of the payment's own cap and the configured one.
std::optional<primitives::Amount> effective_max_fee(
    const std::optional<primitives::Amount>& requested,
    const std::optional<primitives::Amount>& configured) {
    if (requested && configured) return std::min(*requested, *configured);
    return requested ? requested : configured;
}

bool is_conflict(const SelectionFailure& failure) {
    return failure.code() == core::ErrorCode::UTXO_LOCK_CONFLICT;
}

} // namespace

// ---------------------------------------------------------------------------
// Amount validation
// ---------------------------------------------------------------------------

core::Result<void> validate_payment_amount(primitives::Amount amount,
                                           const PlannerOptions& options) {
    if (amount.value() <= 0) {
        return core::Error(core::ErrorCode::VALIDATION_RANGE,
                           "Amount must be positive");
    }
    if (amount < options.min_payment) {
        return core::Error(core::ErrorCode::VALIDATION_RANGE,
                           "Minimum amount is " +
                           options.min_payment.to_string());
    }
    if (amount > options.max_payment) {
        return core::Error(core::ErrorCode::VALIDATION_RANGE,
                           "Maximum amount is " +
                           options.max_payment.to_string());
    }
    return core::make_ok();
}

core::Result<primitives::Amount> parse_payment_amount(
    std::string_view text, const PlannerOptions& options) {
    TXP_TRY_ASSIGN(amount, primitives::Amount::parse(text));
    TXP_TRY_VOID(validate_payment_amount(amount, options));
    return amount;
}

// ---------------------------------------------------------------------------
// PaymentPlanner
// ---------------------------------------------------------------------------

PaymentPlanner::PaymentPlanner(ledger::LedgerClient& ledger,
                               UtxoLockTable& locks,
                               PlannerOptions options)
    : ledger_(ledger), locks_(locks), options_(std::move(options)) {}

core::Result<std::vector<primitives::Utxo>, SelectionFailure>
PaymentPlanner::load(const std::vector<std::string>& addresses,
                     int min_conf) {
    auto inventory = load_inventory(ledger_, addresses, min_conf, &locks_);
    if (!inventory.ok()) {
        return SelectionFailure(inventory.error());
    }
    return std::move(inventory).value();
}

PaymentPlanner::PlanOutcome PaymentPlanner::plan_payment(
    const std::vector<primitives::Utxo>& inventory,
    const TargetPayment& payment,
    const FeeModel& fee_model) {

    auto selection = select_coins_or_change(inventory, payment.amount,
                                            fee_model, options_.max_overpay,
                                            options_.dust_threshold);
    if (!selection.ok()) {
        return selection.error();
    }

    std::string change_address;
    if (needs_change_output(selection.value(), options_.dust_threshold)) {
        auto addr = ledger_.get_change_address();
        if (!addr.ok()) {
            return SelectionFailure(addr.error());
        }
        change_address = addr.value();
    }

    TargetPayment capped = payment;
    capped.max_fee = effective_max_fee(payment.max_fee, options_.max_fee);

    auto plan = build_plan(selection.value(), capped,
                           options_.dust_threshold, change_address);
    if (!plan.ok()) {
        const auto& err = plan.error();
        return SelectionFailure(err.code(), err.message(), payment.amount,
                                selection.value().total_input,
                                selection.value().fee);
    }

    LOG_INFO(core::LogCategory::WALLET,
             "Planned payment of " + payment.amount.to_string() + " to " +
             payment.destination + " using " +
             std::to_string(plan.value().inputs.size()) + " inputs (" +
             std::string(selection_strategy_name(selection.value().strategy)) +
             "), fee " + plan.value().fee.to_string());
    return std::move(plan).value();
}

PaymentPlanner::PlanOutcome PaymentPlanner::select_and_plan(
    const std::vector<std::string>& addresses,
    const std::string& destination,
    primitives::Amount amount,
    std::optional<primitives::FeeRate> fee_rate) {

    auto valid = validate_payment_amount(amount, options_);
    if (!valid.ok()) {
        return SelectionFailure(valid.error());
    }

    auto inventory = load(addresses, options_.min_confirmations);
    if (!inventory.ok()) {
        return inventory.error();
    }

    FeeModel fee_model = options_.fee_model;
    if (fee_rate) fee_model.rate = *fee_rate;

    TargetPayment payment{destination, amount, std::nullopt};
    return plan_payment(inventory.value(), payment, fee_model);
}

PaymentPlanner::PlanOutcome PaymentPlanner::plan_consolidation(
    const std::vector<std::string>& addresses,
    const std::string& destination) {

    auto inventory = load(addresses, options_.min_confirmations);
    if (!inventory.ok()) {
        return inventory.error();
    }

    auto plan = wallet::plan_consolidation(
        inventory.value(), options_.consolidate_threshold,
        options_.consolidate_max_inputs, destination, options_.fee_model,
        options_.dust_threshold);
    if (!plan.ok()) {
        return plan;
    }

    if (options_.max_fee && plan.value().fee > *options_.max_fee) {
        return SelectionFailure(core::ErrorCode::FEE_LIMIT_EXCEEDED,
                                "Consolidation fee " +
                                plan.value().fee.to_string() +
                                " exceeds limit " +
                                options_.max_fee->to_string(),
                                primitives::Amount(0),
                                plan.value().input_total,
                                plan.value().fee);
    }
    return plan;
}

PaymentPlanner::SendOutcome PaymentPlanner::send(
    const std::vector<std::string>& addresses,
    const TargetPayment& payment) {

    auto valid = validate_payment_amount(payment.amount, options_);
    if (!valid.ok()) {
        return SelectionFailure(valid.error());
    }

    return execute_with_retry(
        addresses, [&](const std::vector<primitives::Utxo>& inventory) {
            return plan_payment(inventory, payment, options_.fee_model);
        });
}

PaymentPlanner::SendOutcome PaymentPlanner::consolidate(
    const std::vector<std::string>& addresses,
    const std::string& destination) {

    return execute_with_retry(
        addresses,
        [&](const std::vector<primitives::Utxo>& inventory) -> PlanOutcome {
            auto plan = wallet::plan_consolidation(
                inventory, options_.consolidate_threshold,
                options_.consolidate_max_inputs, destination,
                options_.fee_model, options_.dust_threshold);
            if (plan.ok() && options_.max_fee &&
                plan.value().fee > *options_.max_fee) {
                return SelectionFailure(core::ErrorCode::FEE_LIMIT_EXCEEDED,
                                        "Consolidation fee " +
                                        plan.value().fee.to_string() +
                                        " exceeds limit " +
                                        options_.max_fee->to_string());
            }
            return plan;
        });
}

core::Result<FeeEstimate, SelectionFailure> PaymentPlanner::estimate_fee(
    const std::vector<std::string>& addresses,
    primitives::Amount amount) {

    auto valid = validate_payment_amount(amount, options_);
    if (!valid.ok()) {
        return SelectionFailure(valid.error());
    }

    auto inventory = load(addresses, options_.min_confirmations);
    if (!inventory.ok()) {
        return inventory.error();
    }

    auto selection = select_coins_or_change(
        inventory.value(), amount, options_.fee_model,
        options_.max_overpay, options_.dust_threshold);
    if (!selection.ok()) {
        return selection.error();
    }

    const SelectionResult& sel = selection.value();
    FeeEstimate estimate;
    estimate.num_inputs = sel.chosen.size();
    if (needs_change_output(sel, options_.dust_threshold)) {
        estimate.fee = sel.fee;
        estimate.can_avoid_change = false;
    } else {
        estimate.fee = primitives::Amount(sel.fee.value() +
                                          sel.leftover.value());
        estimate.can_avoid_change = true;
    }
    return estimate;
}

// ---------------------------------------------------------------------------
// Locking and execution
// ---------------------------------------------------------------------------

core::Result<ScopedUtxoLock, SelectionFailure> PaymentPlanner::lock_inputs(
    const TxPlan& plan) {

    auto acquired = locks_.try_acquire(plan.inputs, options_.lock_timeout);
    if (!acquired.ok()) {
        return SelectionFailure(acquired.error());
    }
    ScopedUtxoLock lock = std::move(acquired).value();

    auto pinned = lock.pin_on_node(ledger_);
    if (!pinned.ok()) {
        return SelectionFailure(pinned.error());
    }

    // The snapshot may be stale: every input must still exist on the node.
    for (const auto& op : plan.inputs) {
        auto current = ledger_.get_output(op);
        if (!current.ok()) {
            return SelectionFailure(core::ErrorCode::INVENTORY_UNAVAILABLE,
                                    "Unable to verify input " +
                                    op.to_string() + ": " +
                                    current.error().message());
        }
        if (!current.value()) {
            return SelectionFailure(core::ErrorCode::UTXO_LOCK_CONFLICT,
                                    "Input " + op.to_string() +
                                    " was spent since the snapshot");
        }
    }
    return lock;
}

PaymentPlanner::SendOutcome PaymentPlanner::execute_with_retry(
    const std::vector<std::string>& addresses,
    const PlanBuilder& build) {

    constexpr int MAX_ATTEMPTS = 2;
    for (int attempt = 0; attempt < MAX_ATTEMPTS; ++attempt) {
        auto inventory = load(addresses, options_.min_confirmations);
        if (!inventory.ok()) {
            return inventory.error();
        }

        auto plan = build(inventory.value());
        if (!plan.ok()) {
            return plan.error();
        }

        auto lock = lock_inputs(plan.value());
        if (!lock.ok()) {
            if (is_conflict(lock.error()) && attempt + 1 < MAX_ATTEMPTS) {
                LOG_INFO(core::LogCategory::LOCK,
                         "Lock conflict (" + lock.error().message() +
                         "), re-selecting against a fresh inventory");
                continue;
            }
            return lock.error();
        }

        auto sent = sign_and_broadcast(plan.value(), lock.value());
        if (sent.ok()) {
            sent.value().retries = attempt;
        }
        return sent;
    }

    // Unreachable: the last attempt always returns.
    return SelectionFailure(core::ErrorCode::INTERNAL_ERROR,
                            "Retry loop exhausted");
}

PaymentPlanner::SendOutcome PaymentPlanner::sign_and_broadcast(
    const TxPlan& plan, ScopedUtxoLock& lock) {

    auto raw = ledger_.create_transaction(plan.inputs, plan.outputs);
    if (!raw.ok()) {
        return SelectionFailure(raw.error());
    }

    auto signed_tx = ledger_.sign_transaction(raw.value());
    if (!signed_tx.ok()) {
        return SelectionFailure(core::ErrorCode::SIGNING_FAILED,
                                "Signing failed: " +
                                signed_tx.error().message());
    }
    if (!signed_tx.value().complete) {
        return SelectionFailure(core::ErrorCode::SIGNING_FAILED,
                                "Node returned an incomplete signature set");
    }

    auto txid = ledger_.broadcast_transaction(signed_tx.value());
    if (!txid.ok()) {
        LOG_ERROR(core::LogCategory::WALLET,
                  "Broadcast failed: " + txid.error().message());
        return SelectionFailure(core::ErrorCode::BROADCAST_FAILED,
                                "Broadcast failed: " +
                                txid.error().message());
    }

    LOG_INFO(core::LogCategory::WALLET,
             "Broadcast " + txid.value().to_hex() + " spending " +
             std::to_string(plan.inputs.size()) + " inputs, fee " +
             plan.fee.to_string());

    lock.release();
    return SendResult{txid.value(), plan, 0};
}

} // namespace wallet
