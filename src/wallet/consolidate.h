#pragma once
// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "primitives/amount.h"
#include "primitives/utxo.h"
#include "wallet/assemble.h"
#include "wallet/coin_select.h"
#include "wallet/fee_model.h"

#include <cstddef>
#include <string>
#include <vector>

namespace wallet {

/// Outputs strictly below @p small_threshold, smallest first (equal amounts:
/// more confirmations first), at most @p max_inputs of them.
std::vector<primitives::Utxo> consolidation_candidates(
    const std::vector<primitives::Utxo>& inventory,
    primitives::Amount small_threshold,
    size_t max_inputs);

/// Merge the consolidation candidates into one output of sum - fee to
/// @p destination. Fewer than two candidates, or a merged output that would
/// be dust, fails with CONSOLIDATION_NOT_BENEFICIAL.
core::Result<TxPlan, SelectionFailure> plan_consolidation(
    const std::vector<primitives::Utxo>& inventory,
    primitives::Amount small_threshold,
    size_t max_inputs,
    const std::string& destination,
    const FeeModel& fee_model,
    primitives::Amount dust_threshold);

} // namespace wallet
