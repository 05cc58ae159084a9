// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet/consolidate.h"
#include "core/logging.h"

#include <algorithm>

namespace wallet {

std::vector<primitives::Utxo> consolidation_candidates(
    const std::vector<primitives::Utxo>& inventory,
    primitives::Amount small_threshold,
    size_t max_inputs) {

    std::vector<primitives::Utxo> small;
    for (const auto& u : inventory) {
        if (u.amount < small_threshold) small.push_back(u);
    }

    std::sort(small.begin(), small.end(),
              [](const primitives::Utxo& a, const primitives::Utxo& b) {
                  if (a.amount != b.amount) return a.amount < b.amount;
                  if (a.confirmations != b.confirmations) {
                      return a.confirmations > b.confirmations;
                  }
                  return a.outpoint < b.outpoint;
              });

    if (small.size() > max_inputs) {
        small.resize(max_inputs);
    }
    return small;
}

core::Result<TxPlan, SelectionFailure> plan_consolidation(
    const std::vector<primitives::Utxo>& inventory,
    primitives::Amount small_threshold,
    size_t max_inputs,
    const std::string& destination,
    const FeeModel& fee_model,
    primitives::Amount dust_threshold) {

    if (destination.empty()) {
        return SelectionFailure(core::ErrorCode::VALIDATION_ERROR,
                                "Consolidation destination must not be empty");
    }
    if (max_inputs < 2) {
        return SelectionFailure(core::ErrorCode::VALIDATION_RANGE,
                                "Consolidation needs room for at least two "
                                "inputs");
    }

    auto chosen = consolidation_candidates(inventory, small_threshold,
                                           max_inputs);

    int64_t sum = 0;
    for (const auto& u : chosen) {
        sum += u.amount.value();
    }

    if (chosen.size() < 2) {
        return SelectionFailure(core::ErrorCode::CONSOLIDATION_NOT_BENEFICIAL,
                                "Nothing to consolidate: " +
                                std::to_string(chosen.size()) +
                                " outputs below " +
                                small_threshold.to_string(),
                                small_threshold, primitives::Amount(sum));
    }

    const primitives::Amount fee = fee_model.fee(chosen.size(), 1);
    const int64_t merged = sum - fee.value();
    if (merged <= 0 || merged < dust_threshold.value()) {
        return SelectionFailure(core::ErrorCode::CONSOLIDATION_NOT_BENEFICIAL,
                                "Merging " + std::to_string(chosen.size()) +
                                " outputs would leave only " +
                                primitives::Amount(std::max<int64_t>(merged, 0))
                                    .to_string() + " after fees",
                                small_threshold, primitives::Amount(sum), fee);
    }

    TxPlan plan;
    plan.inputs.reserve(chosen.size());
    for (const auto& u : chosen) {
        plan.inputs.push_back(u.outpoint);
    }
    plan.input_total = primitives::Amount(sum);
    plan.outputs.emplace(destination, primitives::Amount(merged));
    plan.fee = fee;

    auto valid = validate_plan(plan, dust_threshold);
    if (!valid.ok()) {
        return SelectionFailure(core::ErrorCode::INTERNAL_ERROR,
                                "Consolidation plan is invalid: " +
                                valid.error().message());
    }

    LOG_INFO(core::LogCategory::WALLET,
             "Consolidation: " + std::to_string(chosen.size()) +
             " outputs totalling " + plan.input_total.to_string() +
             " into " + primitives::Amount(merged).to_string() +
             " (fee " + fee.to_string() + ")");
    return plan;
}

} // namespace wallet
