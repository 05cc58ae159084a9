#pragma once
// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "primitives/amount.h"
#include "primitives/utxo.h"
#include "wallet/fee_model.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wallet {

// ---------------------------------------------------------------------------
// SelectionFailure -- typed failure crossing the wallet module boundary
// ---------------------------------------------------------------------------
// Carries enough context (target, what was available, the fee that was
// attempted) for a caller to render a precise message without re-deriving
// anything.
// ---------------------------------------------------------------------------

class SelectionFailure {
public:
    SelectionFailure() = default;

    SelectionFailure(core::ErrorCode code, std::string message,
                     primitives::Amount target = primitives::Amount(0),
                     primitives::Amount available = primitives::Amount(0),
                     primitives::Amount fee = primitives::Amount(0))
        : code_(code), message_(std::move(message)),
          target_(target), available_(available), fee_(fee) {}

    /// Wrap a plain core::Error (boundary failures carry no amounts).
    explicit SelectionFailure(const core::Error& err)
        : code_(err.code()), message_(err.message()) {}

    [[nodiscard]] core::ErrorCode code() const { return code_; }
    [[nodiscard]] const std::string& message() const { return message_; }
    [[nodiscard]] primitives::Amount target() const { return target_; }
    [[nodiscard]] primitives::Amount available() const { return available_; }
    [[nodiscard]] primitives::Amount fee() const { return fee_; }

    /// "INSUFFICIENT_FUNDS: <message> (target=.. available=.. fee=..)"
    [[nodiscard]] std::string format() const;

private:
    core::ErrorCode code_ = core::ErrorCode::NONE;
    std::string message_;
    primitives::Amount target_;
    primitives::Amount available_;
    primitives::Amount fee_;
};

// ---------------------------------------------------------------------------
// SelectionResult -- the inputs chosen for one payment
// ---------------------------------------------------------------------------
// total_input = sum(chosen.amount) and leftover = total_input - target - fee,
// never negative.
// ---------------------------------------------------------------------------

enum class SelectionStrategy : uint8_t {
    SINGLE_MATCH    = 0,   // one input covers target + fee within tolerance
    COMBINATION     = 1,   // 2..5 of the largest candidates
    EXACT_SUBSET    = 2,   // zero-leftover subset of a small inventory
    CHANGE_FALLBACK = 3,   // greedy, may produce a change output
};

[[nodiscard]] std::string_view selection_strategy_name(SelectionStrategy s);

struct SelectionResult {
    std::vector<primitives::Utxo> chosen;
    primitives::Amount total_input;
    primitives::Amount fee;
    primitives::Amount leftover;
    SelectionStrategy strategy = SelectionStrategy::SINGLE_MATCH;
    bool change_permitted = false;

    /// Sum of the confirmation counts of all chosen inputs.
    [[nodiscard]] int64_t total_confirmations() const;
};

// ---------------------------------------------------------------------------
// Search bounds
// ---------------------------------------------------------------------------

/// Strategy B only looks at this many of the largest candidates.
inline constexpr size_t COMBINATION_PREFIX = 20;
inline constexpr size_t COMBINATION_MIN_INPUTS = 2;
inline constexpr size_t COMBINATION_MAX_INPUTS = 5;

/// C(20,2) + C(20,3) + C(20,4) + C(20,5).
inline constexpr size_t COMBINATION_MAX_EXAMINED = 21'679;

/// Strategy C is only attempted on inventories up to this size.
inline constexpr size_t EXACT_SUBSET_MAX_CANDIDATES = 15;

// ---------------------------------------------------------------------------
// Coin selection
// ---------------------------------------------------------------------------
// Change-free selection tries, in order:
//   A. single match      (1 input, leftover within max_overpay)
//   B. bounded combos    (2..5 inputs over the 20 largest candidates)
//   C. exact subset-sum  (zero leftover, inventory of at most 15)
// Across strategies: fewer inputs beat a smaller leftover, which beats a
// higher aggregate confirmation count.
// ---------------------------------------------------------------------------

using SelectionOutcome = core::Result<SelectionResult, SelectionFailure>;

/// Change-free selection. Fails with NO_CHANGE_FREE_SOLUTION when none of
/// the strategies succeeds. Never performs I/O.
SelectionOutcome select_coins(const std::vector<primitives::Utxo>& inventory,
                              primitives::Amount target,
                              const FeeModel& fee_model,
                              primitives::Amount max_overpay);

/// Change-permitting greedy selection (largest first). Fails with
/// INSUFFICIENT_FUNDS when even the whole inventory does not cover
/// target + fee.
SelectionOutcome select_coins_with_change(
    const std::vector<primitives::Utxo>& inventory,
    primitives::Amount target,
    const FeeModel& fee_model,
    primitives::Amount dust_threshold);

/// select_coins(), falling back to select_coins_with_change() when no
/// change-free solution exists.
SelectionOutcome select_coins_or_change(
    const std::vector<primitives::Utxo>& inventory,
    primitives::Amount target,
    const FeeModel& fee_model,
    primitives::Amount max_overpay,
    primitives::Amount dust_threshold);

// ---------------------------------------------------------------------------
// Individual strategies (exposed for testing)
// ---------------------------------------------------------------------------
// Each strategy takes candidates already in selection order (see
// sort_candidates) and returns nullopt to let the next one run.
// ---------------------------------------------------------------------------

namespace detail {

/// Amount descending, then confirmations descending, then outpoint.
std::vector<primitives::Utxo> sort_candidates(
    std::vector<primitives::Utxo> inventory);

std::optional<SelectionResult> select_single_match(
    const std::vector<primitives::Utxo>& candidates,
    primitives::Amount target,
    const FeeModel& fee_model,
    primitives::Amount max_overpay);

/// @param examined  If non-null, receives the number of combinations
///                  evaluated.
std::optional<SelectionResult> select_combination(
    const std::vector<primitives::Utxo>& candidates,
    primitives::Amount target,
    const FeeModel& fee_model,
    primitives::Amount max_overpay,
    size_t* examined = nullptr);

std::optional<SelectionResult> select_exact_subset(
    const std::vector<primitives::Utxo>& candidates,
    primitives::Amount target,
    const FeeModel& fee_model);

} // namespace detail

} // namespace wallet
