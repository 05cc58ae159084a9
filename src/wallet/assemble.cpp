// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet/assemble.h"
#include "core/logging.h"

#include <set>

namespace wallet {

primitives::Amount TxPlan::output_total() const {
    int64_t total = 0;
    for (const auto& [address, amount] : outputs) {
        total += amount.value();
    }
    return primitives::Amount(total);
}

bool needs_change_output(const SelectionResult& selection,
                         primitives::Amount dust_threshold) {
    return selection.change_permitted &&
           selection.leftover >= dust_threshold &&
           selection.leftover.value() > 0;
}

// ---------------------------------------------------------------------------
// Plan construction
// ---------------------------------------------------------------------------

core::Result<TxPlan> build_plan(const SelectionResult& selection,
                                const TargetPayment& payment,
                                primitives::Amount dust_threshold,
                                const std::string& change_address) {

    if (payment.destination.empty()) {
        return core::Error(core::ErrorCode::VALIDATION_ERROR,
                           "Destination address must not be empty");
    }
    if (payment.amount < dust_threshold || payment.amount.value() <= 0) {
        return core::Error(core::ErrorCode::VALIDATION_RANGE,
                           "Payment amount " + payment.amount.to_string() +
                           " is below the dust threshold " +
                           dust_threshold.to_string());
    }
    if (selection.chosen.empty()) {
        return core::Error(core::ErrorCode::VALIDATION_ERROR,
                           "Selection must have at least one input");
    }

    // The selection must describe exactly this payment.
    int64_t total_in = 0;
    for (const auto& u : selection.chosen) {
        total_in += u.amount.value();
    }
    if (total_in != selection.total_input.value() ||
        selection.leftover.value() < 0 ||
        total_in - payment.amount.value() - selection.fee.value() !=
            selection.leftover.value()) {
        return core::Error(core::ErrorCode::INTERNAL_ERROR,
                           "Selection does not balance against payment of " +
                           payment.amount.to_string());
    }

    TxPlan plan;
    plan.inputs.reserve(selection.chosen.size());
    for (const auto& u : selection.chosen) {
        plan.inputs.push_back(u.outpoint);
    }
    plan.input_total = selection.total_input;
    plan.outputs.emplace(payment.destination, payment.amount);

    if (needs_change_output(selection, dust_threshold)) {
        if (change_address.empty()) {
            return core::Error(core::ErrorCode::VALIDATION_ERROR,
                               "Change address required for change of " +
                               selection.leftover.to_string());
        }
        if (change_address == payment.destination) {
            return core::Error(core::ErrorCode::VALIDATION_ERROR,
                               "Change address must differ from the "
                               "destination " + payment.destination);
        }
        plan.outputs.emplace(change_address, selection.leftover);
        plan.change_address = change_address;
        plan.fee = selection.fee;
    } else {
        plan.fee = primitives::Amount(selection.fee.value() +
                                      selection.leftover.value());
        if (selection.leftover.value() > 0) {
            LOG_DEBUG(core::LogCategory::WALLET,
                      "Folding leftover " + selection.leftover.to_string() +
                      " into fee, total fee " + plan.fee.to_string());
        }
    }

    if (payment.max_fee && plan.fee > *payment.max_fee) {
        return core::Error(core::ErrorCode::FEE_LIMIT_EXCEEDED,
                           "Fee " + plan.fee.to_string() +
                           " exceeds limit " + payment.max_fee->to_string());
    }

    auto valid = validate_plan(plan, dust_threshold);
    if (!valid.ok()) {
        return core::Error(core::ErrorCode::INTERNAL_ERROR,
                           "Assembled plan is invalid: " +
                           valid.error().message());
    }
    return plan;
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

core::Result<void> validate_plan(const TxPlan& plan,
                                 primitives::Amount dust_threshold) {
    if (plan.inputs.empty()) {
        return core::Error(core::ErrorCode::VALIDATION_ERROR,
                           "Plan has no inputs");
    }
    if (plan.outputs.empty()) {
        return core::Error(core::ErrorCode::VALIDATION_ERROR,
                           "Plan has no outputs");
    }

    std::set<primitives::OutPoint> seen;
    for (const auto& op : plan.inputs) {
        if (!seen.insert(op).second) {
            return core::Error(core::ErrorCode::VALIDATION_ERROR,
                               "Duplicate input " + op.to_string());
        }
    }

    for (const auto& [address, amount] : plan.outputs) {
        if (amount.value() <= 0 || amount < dust_threshold) {
            return core::Error(core::ErrorCode::VALIDATION_RANGE,
                               "Output to " + address + " of " +
                               amount.to_string() + " is dust");
        }
    }

    if (plan.fee.value() < 0) {
        return core::Error(core::ErrorCode::VALIDATION_RANGE,
                           "Negative fee " + plan.fee.to_string());
    }

    int64_t out = plan.output_total().value() + plan.fee.value();
    if (out != plan.input_total.value()) {
        return core::Error(core::ErrorCode::VALIDATION_ERROR,
                           "Outputs plus fee (" +
                           primitives::Amount(out).to_string() +
                           ") do not equal inputs (" +
                           plan.input_total.to_string() + ")");
    }
    return core::make_ok();
}

} // namespace wallet
