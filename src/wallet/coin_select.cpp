// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet/coin_select.h"
#include "core/logging.h"
#include "core/time.h"

#include <algorithm>
#include <cstdint>
#include <map>
#include <numeric>

namespace wallet {

// ---------------------------------------------------------------------------
// SelectionFailure / SelectionResult
// ---------------------------------------------------------------------------

std::string SelectionFailure::format() const {
    std::string out(core::error_code_name(code_));
    out += ": ";
    out += message_;
    if (target_.value() != 0 || available_.value() != 0 ||
        fee_.value() != 0) {
        out += " (target=" + target_.to_string() +
               " available=" + available_.to_string() +
               " fee=" + fee_.to_string() + ")";
    }
    return out;
}

std::string_view selection_strategy_name(SelectionStrategy s) {
    switch (s) {
        case SelectionStrategy::SINGLE_MATCH:    return "single-match";
        case SelectionStrategy::COMBINATION:     return "combination";
        case SelectionStrategy::EXACT_SUBSET:    return "exact-subset";
        case SelectionStrategy::CHANGE_FALLBACK: return "change-fallback";
        default:                                 return "unknown";
    }
}

int64_t SelectionResult::total_confirmations() const {
    int64_t total = 0;
    for (const auto& u : chosen) {
        total += u.confirmations;
    }
    return total;
}

namespace {

/// Assemble a SelectionResult from candidate indices.
SelectionResult make_selection(const std::vector<primitives::Utxo>& candidates,
                               const std::vector<size_t>& indices,
                               primitives::Amount target,
                               primitives::Amount fee,
                               SelectionStrategy strategy) {
    SelectionResult result;
    int64_t total = 0;
    result.chosen.reserve(indices.size());
    for (size_t idx : indices) {
        result.chosen.push_back(candidates[idx]);
        total += candidates[idx].amount.value();
    }
    result.total_input = primitives::Amount(total);
    result.fee = fee;
    result.leftover =
        primitives::Amount(total - target.value() - fee.value());
    result.strategy = strategy;
    result.change_permitted = false;
    return result;
}

std::optional<SelectionFailure> check_request(primitives::Amount target,
                                              primitives::Amount max_overpay) {
    if (target.value() <= 0 || !target.is_valid()) {
        return SelectionFailure(core::ErrorCode::VALIDATION_RANGE,
                                "Payment amount must be positive and within "
                                "the money range: " + target.to_string(),
                                target);
    }
    if (max_overpay.value() < 0) {
        return SelectionFailure(core::ErrorCode::VALIDATION_RANGE,
                                "max_overpay must not be negative: " +
                                max_overpay.to_string(),
                                target);
    }
    return std::nullopt;
}

} // namespace

// ---------------------------------------------------------------------------
// Main selection entry points
// ---------------------------------------------------------------------------

SelectionOutcome select_coins(const std::vector<primitives::Utxo>& inventory,
                              primitives::Amount target,
                              const FeeModel& fee_model,
                              primitives::Amount max_overpay) {
    if (auto bad = check_request(target, max_overpay)) {
        return *bad;
    }

    const auto candidates = detail::sort_candidates(inventory);

    if (auto single = detail::select_single_match(
            candidates, target, fee_model, max_overpay)) {
        LOG_DEBUG(core::LogCategory::SELECT,
                  "Coin selection: single match, leftover " +
                  single->leftover.to_string());
        return *single;
    }

    core::StopWatch sw;
    size_t examined = 0;
    if (auto combo = detail::select_combination(
            candidates, target, fee_model, max_overpay, &examined)) {
        LOG_DEBUG(core::LogCategory::SELECT,
                  "Coin selection: combination of " +
                  std::to_string(combo->chosen.size()) + " inputs after " +
                  std::to_string(examined) + " candidates examined (" +
                  std::to_string(sw.elapsed_us()) + "us)");
        return *combo;
    }

    if (auto exact = detail::select_exact_subset(
            candidates, target, fee_model)) {
        LOG_DEBUG(core::LogCategory::SELECT,
                  "Coin selection: exact subset of " +
                  std::to_string(exact->chosen.size()) + " inputs");
        return *exact;
    }

    int64_t available = 0;
    for (const auto& u : candidates) {
        available += u.amount.value();
    }
    return SelectionFailure(core::ErrorCode::NO_CHANGE_FREE_SOLUTION,
                            "No change-free combination of " +
                            std::to_string(candidates.size()) +
                            " outputs pays " + target.to_string(),
                            target, primitives::Amount(available),
                            fee_model.fee(1, 1));
}

SelectionOutcome select_coins_with_change(
    const std::vector<primitives::Utxo>& inventory,
    primitives::Amount target,
    const FeeModel& fee_model,
    primitives::Amount dust_threshold) {

    if (auto bad = check_request(target, primitives::Amount(0))) {
        return *bad;
    }

    const auto candidates = detail::sort_candidates(inventory);

    std::vector<size_t> picked;
    int64_t total = 0;
    for (size_t i = 0; i < candidates.size(); ++i) {
        picked.push_back(i);
        total += candidates[i].amount.value();
        const size_t k = picked.size();

        // Pay with change when the change would not be dust.
        primitives::Amount fee2 = fee_model.fee(k, 2);
        int64_t change = total - target.value() - fee2.value();
        if (change >= dust_threshold.value()) {
            auto result = make_selection(candidates, picked, target, fee2,
                                         SelectionStrategy::CHANGE_FALLBACK);
            result.change_permitted = true;
            LOG_DEBUG(core::LogCategory::SELECT,
                      "Coin selection: greedy fallback with " +
                      std::to_string(k) + " inputs, change " +
                      result.leftover.to_string());
            return result;
        }

        // Otherwise a single output, with whatever is left going to fee.
        primitives::Amount fee1 = fee_model.fee(k, 1);
        if (total >= target.value() + fee1.value()) {
            auto result = make_selection(candidates, picked, target, fee1,
                                         SelectionStrategy::CHANGE_FALLBACK);
            LOG_DEBUG(core::LogCategory::SELECT,
                      "Coin selection: " +
                      std::string(core::error_code_name(
                          core::ErrorCode::DUST_CHANGE_REJECTED)) +
                      ", change below dust (" +
                      primitives::Amount(std::max<int64_t>(change, 0))
                          .to_string() +
                      "), folding " + result.leftover.to_string() +
                      " into fee");
            return result;
        }
    }

    const size_t n = std::max<size_t>(candidates.size(), 1);
    primitives::Amount fee = fee_model.fee(n, 1);
    return SelectionFailure(core::ErrorCode::INSUFFICIENT_FUNDS,
                            "Insufficient funds: have " +
                            primitives::Amount(total).to_string() +
                            ", need " +
                            primitives::Amount(target.value() + fee.value())
                                .to_string() +
                            " including fee",
                            target, primitives::Amount(total), fee);
}

SelectionOutcome select_coins_or_change(
    const std::vector<primitives::Utxo>& inventory,
    primitives::Amount target,
    const FeeModel& fee_model,
    primitives::Amount max_overpay,
    primitives::Amount dust_threshold) {

    auto change_free = select_coins(inventory, target, fee_model, max_overpay);
    if (change_free.ok() ||
        change_free.error().code() != core::ErrorCode::NO_CHANGE_FREE_SOLUTION) {
        return change_free;
    }

    LOG_DEBUG(core::LogCategory::SELECT,
              "No change-free solution, retrying with change permitted");
    return select_coins_with_change(inventory, target, fee_model,
                                    dust_threshold);
}

// ---------------------------------------------------------------------------
// Strategies
// ---------------------------------------------------------------------------

namespace detail {

std::vector<primitives::Utxo> sort_candidates(
    std::vector<primitives::Utxo> inventory) {
    std::sort(inventory.begin(), inventory.end(),
              [](const primitives::Utxo& a, const primitives::Utxo& b) {
                  if (a.amount != b.amount) return a.amount > b.amount;
                  if (a.confirmations != b.confirmations) {
                      return a.confirmations > b.confirmations;
                  }
                  return a.outpoint < b.outpoint;
              });
    return inventory;
}

std::optional<SelectionResult> select_single_match(
    const std::vector<primitives::Utxo>& candidates,
    primitives::Amount target,
    const FeeModel& fee_model,
    primitives::Amount max_overpay) {

    const int64_t need = target.value() + fee_model.fee(1, 1).value();

    std::optional<size_t> best;
    int64_t best_leftover = 0;
    for (size_t i = 0; i < candidates.size(); ++i) {
        int64_t leftover = candidates[i].amount.value() - need;
        // Descending order: nothing after this can cover the target.
        if (leftover < 0) break;
        if (leftover > max_overpay.value()) continue;

        if (!best || leftover < best_leftover ||
            (leftover == best_leftover &&
             candidates[i].confirmations > candidates[*best].confirmations)) {
            best = i;
            best_leftover = leftover;
        }
    }

    if (!best) return std::nullopt;
    return make_selection(candidates, {*best}, target, fee_model.fee(1, 1),
                          SelectionStrategy::SINGLE_MATCH);
}

std::optional<SelectionResult> select_combination(
    const std::vector<primitives::Utxo>& candidates,
    primitives::Amount target,
    const FeeModel& fee_model,
    primitives::Amount max_overpay,
    size_t* examined) {

    const size_t m = std::min(candidates.size(), COMBINATION_PREFIX);
    size_t count = 0;

    for (size_t k = COMBINATION_MIN_INPUTS;
         k <= COMBINATION_MAX_INPUTS && k <= m; ++k) {
        const primitives::Amount fee = fee_model.fee(k, 1);
        const int64_t need = target.value() + fee.value();

        std::vector<size_t> idx(k);
        std::iota(idx.begin(), idx.end(), size_t{0});

        std::vector<size_t> best;
        int64_t best_leftover = 0;
        int64_t best_conf = 0;

        while (true) {
            ++count;

            int64_t sum = 0;
            int64_t conf = 0;
            for (size_t i : idx) {
                sum += candidates[i].amount.value();
                conf += candidates[i].confirmations;
            }

            int64_t leftover = sum - need;
            if (leftover >= 0 && leftover <= max_overpay.value()) {
                if (best.empty() || leftover < best_leftover ||
                    (leftover == best_leftover && conf > best_conf)) {
                    best = idx;
                    best_leftover = leftover;
                    best_conf = conf;
                }
            }

            // Advance to the next k-combination in lexicographic order.
            size_t pos = k;
            while (pos > 0 && idx[pos - 1] == m - k + (pos - 1)) {
                --pos;
            }
            if (pos == 0) break;
            ++idx[pos - 1];
            for (size_t j = pos; j < k; ++j) {
                idx[j] = idx[j - 1] + 1;
            }
        }

        if (!best.empty()) {
            if (examined) *examined = count;
            return make_selection(candidates, best, target, fee,
                                  SelectionStrategy::COMBINATION);
        }
    }

    if (examined) *examined = count;
    return std::nullopt;
}

std::optional<SelectionResult> select_exact_subset(
    const std::vector<primitives::Utxo>& candidates,
    primitives::Amount target,
    const FeeModel& fee_model) {

    const size_t n = candidates.size();
    if (n == 0 || n > EXACT_SUBSET_MAX_CANDIDATES) return std::nullopt;

    // No subset sum above the largest adjusted target can ever match.
    const int64_t max_need = target.value() + fee_model.fee(n, 1).value();

    struct Cell {
        uint32_t mask = 0;
        int64_t confirmations = 0;
    };

    // table[c] maps an achievable sum using exactly c inputs to the subset
    // with the highest aggregate confirmations reaching it.
    std::vector<std::map<int64_t, Cell>> table(n + 1);
    table[0][0] = Cell{};

    for (size_t i = 0; i < n; ++i) {
        const int64_t value = candidates[i].amount.value();
        const int64_t conf = candidates[i].confirmations;

        for (size_t c = i + 1; c >= 1; --c) {
            for (const auto& [sum, cell] : table[c - 1]) {
                int64_t next = sum + value;
                if (next > max_need) continue;

                Cell cand{cell.mask | (uint32_t{1} << i),
                          cell.confirmations + conf};
                auto [it, inserted] = table[c].try_emplace(next, cand);
                if (!inserted && cand.confirmations > it->second.confirmations) {
                    it->second = cand;
                }
            }
        }
    }

    for (size_t k = 1; k <= n; ++k) {
        const primitives::Amount fee = fee_model.fee(k, 1);
        auto it = table[k].find(target.value() + fee.value());
        if (it == table[k].end()) continue;

        std::vector<size_t> indices;
        for (size_t i = 0; i < n; ++i) {
            if (it->second.mask & (uint32_t{1} << i)) indices.push_back(i);
        }
        return make_selection(candidates, indices, target, fee,
                              SelectionStrategy::EXACT_SUBSET);
    }
    return std::nullopt;
}

} // namespace detail

} // namespace wallet
