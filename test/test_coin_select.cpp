// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"

#include "core/logging.h"
#include "core/random.h"
#include "primitives/amount.h"
#include "primitives/utxo.h"
#include "wallet/coin_select.h"
#include "wallet/fee_model.h"
#include "wallet/options.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <string>
#include <vector>

using primitives::Amount;

namespace {

constexpr int64_t COIN = Amount::COIN;

primitives::Utxo make_utxo(int64_t amount, int confirmations = 6) {
    primitives::Utxo u;
    u.outpoint = primitives::OutPoint(core::get_random_uint256(), 0);
    u.address = "addr1";
    u.amount = Amount(amount);
    u.confirmations = confirmations;
    return u;
}

std::vector<primitives::Utxo> coins(const std::vector<int64_t>& whole_coins) {
    std::vector<primitives::Utxo> out;
    for (int64_t c : whole_coins) out.push_back(make_utxo(c * COIN));
    return out;
}

/// Every SelectionResult must balance and draw only from the inventory.
void check_selection_invariants(const wallet::SelectionResult& sel,
                                const std::vector<primitives::Utxo>& inventory,
                                Amount target) {
    int64_t sum = 0;
    std::set<primitives::OutPoint> seen;
    for (const auto& u : sel.chosen) {
        sum += u.amount.value();
        CHECK(seen.insert(u.outpoint).second);
        bool found = false;
        for (const auto& inv : inventory) {
            if (inv.outpoint == u.outpoint) found = true;
        }
        CHECK(found);
    }
    CHECK_EQ(sel.total_input.value(), sum);
    CHECK(sel.leftover.value() >= 0);
    CHECK_EQ(sel.total_input.value(),
             target.value() + sel.fee.value() + sel.leftover.value());
}

} // namespace

// ===========================================================================
// Wallet :: fee model
// ===========================================================================

TEST_CASE(FeeModel, EstimateTxSize) {
    CHECK_EQ(wallet::estimate_tx_size(1, 1), size_t{192});
    CHECK_EQ(wallet::estimate_tx_size(1, 2), size_t{226});
    CHECK_EQ(wallet::estimate_tx_size(3, 2), size_t{522});
    CHECK_EQ(wallet::estimate_tx_size(0, 0), wallet::TX_BYTES_OVERHEAD);
}

TEST_CASE(FeeModel, DefaultFees) {
    wallet::FeeModel model;
    CHECK_EQ(model.fee(1, 1).value(), int64_t{192'000});
    CHECK_EQ(model.fee(1, 2).value(), int64_t{226'000});
    CHECK_EQ(model.fee(2, 1).value(), int64_t{340'000});
    CHECK_EQ(model.fee(3, 2).value(), int64_t{522'000});
    CHECK_EQ(model.fee(20, 1).value(), int64_t{3'004'000});
}

TEST_CASE(FeeModel, MinimumFeeFloor) {
    wallet::FeeModel model;
    model.rate = primitives::FeeRate(Amount(1000));
    // 192 bytes at 1000/kB is 192, well under the floor.
    CHECK_EQ(model.fee(1, 1), wallet::DEFAULT_MIN_FEE);

    model.min_fee = Amount(0);
    CHECK_EQ(model.fee(1, 1).value(), int64_t{192});
}

TEST_CASE(FeeModel, MonotoneInInputsAndOutputs) {
    wallet::FeeModel model;
    for (size_t in = 1; in < 30; ++in) {
        for (size_t out = 1; out < 4; ++out) {
            CHECK(model.fee(in + 1, out) >= model.fee(in, out));
            CHECK(model.fee(in, out + 1) >= model.fee(in, out));
        }
    }
}

TEST_CASE(FeeModel, LargestAcceptedRateStaysMonotone) {
    wallet::PlannerOptions opts;
    opts.fee_model.rate = primitives::FeeRate(Amount(Amount::MAX_MONEY));
    CHECK_OK(opts.validate());

    const wallet::FeeModel& model = opts.fee_model;
    // 100 inputs is 14'844 bytes; the product would not fit in int64_t.
    CHECK_EQ(model.fee(100, 1).value(), Amount::MAX_MONEY);
    CHECK_EQ(model.fee(opts.consolidate_max_inputs, 2).value(),
             Amount::MAX_MONEY);
    for (size_t in = 1; in < 120; ++in) {
        CHECK(model.fee(in + 1, 1) >= model.fee(in, 1));
        CHECK(model.fee(in, 2) >= model.fee(in, 1));
    }
}

// ===========================================================================
// Wallet :: candidate ordering
// ===========================================================================

TEST_CASE(CoinSelect, SortCandidatesOrder) {
    auto a = make_utxo(5 * COIN, 1);
    auto b = make_utxo(5 * COIN, 9);
    auto c = make_utxo(7 * COIN, 1);
    auto sorted = wallet::detail::sort_candidates({a, b, c});
    CHECK(sorted[0].outpoint == c.outpoint);
    CHECK(sorted[1].outpoint == b.outpoint);
    CHECK(sorted[2].outpoint == a.outpoint);
}

// ===========================================================================
// Wallet :: strategy A (single match)
// ===========================================================================

TEST_CASE(CoinSelect, SingleMatchPrefersSmallestLeftover) {
    wallet::FeeModel model;
    auto close = make_utxo(10 * COIN + 500'000);   // leftover 308'000
    auto loose = make_utxo(10 * COIN + 1'000'000); // leftover 808'000
    auto big = make_utxo(50 * COIN);
    std::vector<primitives::Utxo> inv{loose, big, close};

    auto sel = wallet::select_coins(inv, Amount(10 * COIN), model,
                                    wallet::DEFAULT_MAX_OVERPAY);
    CHECK_OK(sel);
    CHECK(sel.value().strategy == wallet::SelectionStrategy::SINGLE_MATCH);
    CHECK_EQ(sel.value().chosen.size(), size_t{1});
    CHECK(sel.value().chosen[0].outpoint == close.outpoint);
    CHECK_EQ(sel.value().leftover.value(), int64_t{308'000});
    CHECK(!sel.value().change_permitted);
    check_selection_invariants(sel.value(), inv, Amount(10 * COIN));
}

TEST_CASE(CoinSelect, SingleMatchConfirmationTiebreak) {
    wallet::FeeModel model;
    auto young = make_utxo(3 * COIN + 192'000, 1);
    auto old = make_utxo(3 * COIN + 192'000, 50);
    std::vector<primitives::Utxo> inv{young, old};

    auto sel = wallet::select_coins(inv, Amount(3 * COIN), model,
                                    wallet::DEFAULT_MAX_OVERPAY);
    CHECK_OK(sel);
    CHECK(sel.value().chosen[0].outpoint == old.outpoint);
    CHECK_EQ(sel.value().leftover.value(), int64_t{0});
}

TEST_CASE(CoinSelect, SingleMatchBeatsTighterCombination) {
    wallet::FeeModel model;
    // 6 + 4.00348 leaves only 8'000 as a pair, but one input wins.
    std::vector<primitives::Utxo> inv{make_utxo(10 * COIN + 900'000),
                                      make_utxo(6 * COIN),
                                      make_utxo(4 * COIN + 348'000)};
    auto sel = wallet::select_coins(inv, Amount(10 * COIN), model,
                                    wallet::DEFAULT_MAX_OVERPAY);
    CHECK_OK(sel);
    CHECK(sel.value().strategy == wallet::SelectionStrategy::SINGLE_MATCH);
    CHECK_EQ(sel.value().chosen.size(), size_t{1});
}

// ===========================================================================
// Wallet :: strategy B (bounded combinations)
// ===========================================================================

TEST_CASE(CoinSelect, CombinationFindsPair) {
    wallet::FeeModel model;
    // 6 + 4.00348 = 10.00348, need 10 + fee(2,1) = 10.0034.
    std::vector<primitives::Utxo> inv{make_utxo(6 * COIN),
                                      make_utxo(4 * COIN + 348'000),
                                      make_utxo(1 * COIN)};
    auto sel = wallet::select_coins(inv, Amount(10 * COIN), model,
                                    wallet::DEFAULT_MAX_OVERPAY);
    CHECK_OK(sel);
    CHECK(sel.value().strategy == wallet::SelectionStrategy::COMBINATION);
    CHECK_EQ(sel.value().chosen.size(), size_t{2});
    CHECK_EQ(sel.value().fee.value(), int64_t{340'000});
    CHECK_EQ(sel.value().leftover.value(), int64_t{8'000});
    check_selection_invariants(sel.value(), inv, Amount(10 * COIN));
}

TEST_CASE(CoinSelect, CombinationSearchIsBounded) {
    wallet::FeeModel model;
    std::vector<primitives::Utxo> inv;
    for (int i = 0; i < 60; ++i) inv.push_back(make_utxo(COIN));

    auto candidates = wallet::detail::sort_candidates(inv);
    size_t examined = 0;
    auto combo = wallet::detail::select_combination(
        candidates, Amount(1000 * COIN), model, wallet::DEFAULT_MAX_OVERPAY,
        &examined);
    CHECK(!combo.has_value());
    CHECK_EQ(examined, wallet::COMBINATION_MAX_EXAMINED);
}

TEST_CASE(CoinSelect, CombinationIgnoresCandidatesBeyondPrefix) {
    wallet::FeeModel model;
    // Twenty large outputs, then two small ones that would pay exactly.
    std::vector<primitives::Utxo> inv;
    for (int i = 0; i < 20; ++i) inv.push_back(make_utxo(100 * COIN));
    inv.push_back(make_utxo(COIN));
    inv.push_back(make_utxo(COIN + 340'000));

    auto candidates = wallet::detail::sort_candidates(inv);
    auto combo = wallet::detail::select_combination(
        candidates, Amount(2 * COIN), model, wallet::DEFAULT_MAX_OVERPAY);
    CHECK(!combo.has_value());
}

// ===========================================================================
// Wallet :: strategy C (exact subset)
// ===========================================================================

TEST_CASE(CoinSelect, ExactSubsetFindsSixInputs) {
    wallet::FeeModel model;
    // Six 1-coin outputs pay target + fee(6,1) = 6 coin exactly; no subset of
    // five or fewer can reach the target.
    std::vector<primitives::Utxo> inv;
    for (int conf = 1; conf <= 7; ++conf) inv.push_back(make_utxo(COIN, conf));
    const Amount target(6 * COIN - model.fee(6, 1).value());

    auto sel = wallet::select_coins(inv, target, model,
                                    wallet::DEFAULT_MAX_OVERPAY);
    CHECK_OK(sel);
    CHECK(sel.value().strategy == wallet::SelectionStrategy::EXACT_SUBSET);
    CHECK_EQ(sel.value().chosen.size(), size_t{6});
    CHECK_EQ(sel.value().leftover.value(), int64_t{0});
    // The youngest output is the one left out.
    CHECK_EQ(sel.value().total_confirmations(), int64_t{2 + 3 + 4 + 5 + 6 + 7});
    check_selection_invariants(sel.value(), inv, target);
}

TEST_CASE(CoinSelect, ExactSubsetSkipsLargeInventories) {
    wallet::FeeModel model;
    std::vector<primitives::Utxo> inv;
    for (size_t i = 0; i <= wallet::EXACT_SUBSET_MAX_CANDIDATES; ++i) {
        inv.push_back(make_utxo(COIN));
    }
    const Amount target(6 * COIN - model.fee(6, 1).value());
    auto exact = wallet::detail::select_exact_subset(
        wallet::detail::sort_candidates(inv), target, model);
    CHECK(!exact.has_value());
}

TEST_CASE(CoinSelect, ExactSubsetFindsOnlyExactSums) {
    wallet::FeeModel model;
    std::vector<primitives::Utxo> inv = coins({3, 5, 9});
    auto exact = wallet::detail::select_exact_subset(
        wallet::detail::sort_candidates(inv), Amount(8 * COIN), model);
    CHECK(!exact.has_value());

    const Amount target(8 * COIN - model.fee(2, 1).value());
    exact = wallet::detail::select_exact_subset(
        wallet::detail::sort_candidates(inv), target, model);
    CHECK(exact.has_value());
    CHECK_EQ(exact->chosen.size(), size_t{2});
    CHECK_EQ(exact->leftover.value(), int64_t{0});
}

TEST_CASE(CoinSelect, ExactSubsetMatchesBruteForce) {
    wallet::FeeModel model;
    uint64_t state = 0x2545f4914f6cdd1dULL;
    auto next = [&] {
        state ^= state << 13;
        state ^= state >> 7;
        state ^= state << 17;
        return state;
    };

    for (int round = 0; round < 200; ++round) {
        const size_t n = 1 + next() % wallet::EXACT_SUBSET_MAX_CANDIDATES;
        std::vector<primitives::Utxo> inv;
        for (size_t i = 0; i < n; ++i) {
            // Coarse amounts so distinct subsets often share a sum.
            inv.push_back(make_utxo(COIN / 4 * static_cast<int64_t>(
                                        1 + next() % 12),
                                    static_cast<int>(next() % 20)));
        }
        const auto sorted = wallet::detail::sort_candidates(inv);

        // Half the rounds aim at a real subset, half at an arbitrary amount.
        int64_t target = 0;
        if (round % 2 == 0) {
            const uint32_t pick = 1 + static_cast<uint32_t>(
                next() % ((uint32_t{1} << n) - 1));
            int64_t sum = 0;
            size_t k = 0;
            for (size_t i = 0; i < n; ++i) {
                if (pick & (uint32_t{1} << i)) {
                    sum += sorted[i].amount.value();
                    ++k;
                }
            }
            target = sum - model.fee(k, 1).value();
        } else {
            target = COIN / 100 + static_cast<int64_t>(next() % (20 * COIN));
        }
        if (target <= 0) continue;

        bool exists = false;
        for (uint32_t mask = 1; mask < (uint32_t{1} << n) && !exists; ++mask) {
            int64_t sum = 0;
            size_t k = 0;
            for (size_t i = 0; i < n; ++i) {
                if (mask & (uint32_t{1} << i)) {
                    sum += sorted[i].amount.value();
                    ++k;
                }
            }
            exists = sum == target + model.fee(k, 1).value();
        }

        auto exact = wallet::detail::select_exact_subset(sorted, Amount(target),
                                                         model);
        CHECK_EQ(exact.has_value(), exists);
        if (exact) {
            CHECK_EQ(exact->leftover.value(), int64_t{0});
            CHECK_EQ(exact->fee, model.fee(exact->chosen.size(), 1));
            check_selection_invariants(*exact, inv, Amount(target));
        }
    }
}

// ===========================================================================
// Wallet :: change-permitting fallback
// ===========================================================================

TEST_CASE(CoinSelect, NoChangeFreeSolution) {
    wallet::FeeModel model;
    auto inv = coins({50, 30, 20, 5});
    auto sel = wallet::select_coins(inv, Amount(80 * COIN), model,
                                    wallet::DEFAULT_MAX_OVERPAY);
    CHECK_ERR_CODE(sel, core::ErrorCode::NO_CHANGE_FREE_SOLUTION);
    CHECK_EQ(sel.error().available().value(), 105 * COIN);
}

TEST_CASE(CoinSelect, FallbackWithChange) {
    wallet::FeeModel model;
    auto inv = coins({50, 30, 20, 5});
    auto sel = wallet::select_coins_or_change(
        inv, Amount(80 * COIN), model, wallet::DEFAULT_MAX_OVERPAY,
        wallet::DEFAULT_DUST_THRESHOLD);
    CHECK_OK(sel);
    const auto& r = sel.value();
    CHECK(r.strategy == wallet::SelectionStrategy::CHANGE_FALLBACK);
    CHECK(r.change_permitted);
    CHECK_EQ(r.chosen.size(), size_t{3});
    CHECK_EQ(r.total_input.value(), 100 * COIN);
    CHECK_EQ(r.fee.value(), int64_t{522'000});
    CHECK_EQ(r.leftover.value(), int64_t{1'999'478'000});
    check_selection_invariants(r, inv, Amount(80 * COIN));
}

TEST_CASE(CoinSelect, FallbackFoldsDustChange) {
    wallet::FeeModel model;
    // One input: 10.0025 coin for a 10 coin payment. With change the leftover
    // would be 24'000, under the dust threshold, so it goes to the fee.
    auto inv = std::vector<primitives::Utxo>{make_utxo(10 * COIN + 250'000)};
    auto sel = wallet::select_coins_with_change(
        inv, Amount(10 * COIN), model, wallet::DEFAULT_DUST_THRESHOLD);
    CHECK_OK(sel);
    CHECK(!sel.value().change_permitted);
    CHECK_EQ(sel.value().fee.value(), int64_t{192'000});
    CHECK_EQ(sel.value().leftover.value(), int64_t{58'000});
}

TEST_CASE(CoinSelect, FoldIsLoggedAsRejectedDustChange) {
    auto& logger = core::Logger::instance();
    const core::LogLevel saved = logger.level();
    const auto path = std::filesystem::temp_directory_path() /
        ("txplan_log_" + std::to_string(core::get_random_uint64()));
    CHECK(logger.set_log_file(path));
    logger.set_print_to_file(true);
    logger.set_print_to_console(false);
    logger.set_level(core::LogLevel::DEBUG);

    wallet::FeeModel model;
    auto inv = std::vector<primitives::Utxo>{make_utxo(10 * COIN + 250'000)};
    CHECK_OK(wallet::select_coins_with_change(
        inv, Amount(10 * COIN), model, wallet::DEFAULT_DUST_THRESHOLD));

    logger.set_level(saved);
    logger.set_print_to_console(true);
    logger.set_print_to_file(false);
    logger.flush();
    CHECK(logger.set_log_file({}));

    std::ifstream in(path);
    std::stringstream text;
    text << in.rdbuf();
    CHECK(text.str().find("select: Coin selection: DUST_CHANGE_REJECTED") !=
          std::string::npos);
    std::filesystem::remove(path);
}

TEST_CASE(CoinSelect, InsufficientFundsExactBalance) {
    wallet::FeeModel model;
    auto inv = coins({100});
    auto sel = wallet::select_coins_or_change(
        inv, Amount(100 * COIN), model, wallet::DEFAULT_MAX_OVERPAY,
        wallet::DEFAULT_DUST_THRESHOLD);
    CHECK_ERR_CODE(sel, core::ErrorCode::INSUFFICIENT_FUNDS);
    CHECK_EQ(sel.error().target().value(), 100 * COIN);
    CHECK_EQ(sel.error().available().value(), 100 * COIN);
    CHECK_EQ(sel.error().fee().value(), int64_t{192'000});
    CHECK(sel.error().format().find("INSUFFICIENT_FUNDS") != std::string::npos);
}

TEST_CASE(CoinSelect, EmptyInventory) {
    wallet::FeeModel model;
    auto sel = wallet::select_coins_or_change(
        {}, Amount(COIN), model, wallet::DEFAULT_MAX_OVERPAY,
        wallet::DEFAULT_DUST_THRESHOLD);
    CHECK_ERR_CODE(sel, core::ErrorCode::INSUFFICIENT_FUNDS);
    CHECK_EQ(sel.error().available().value(), int64_t{0});
}

TEST_CASE(CoinSelect, RejectsNonPositiveTarget) {
    wallet::FeeModel model;
    auto inv = coins({1});
    CHECK_ERR_CODE(wallet::select_coins(inv, Amount(0), model,
                                        wallet::DEFAULT_MAX_OVERPAY),
                   core::ErrorCode::VALIDATION_RANGE);
    CHECK_ERR_CODE(wallet::select_coins_with_change(
                       inv, Amount(-5), model, wallet::DEFAULT_DUST_THRESHOLD),
                   core::ErrorCode::VALIDATION_RANGE);
}

TEST_CASE(CoinSelect, ResultsBalanceAcrossInventories) {
    wallet::FeeModel model;
    // Deterministic pseudo-random inventories.
    uint64_t state = 0x9e3779b97f4a7c15ULL;
    auto next = [&] {
        state ^= state << 13;
        state ^= state >> 7;
        state ^= state << 17;
        return state;
    };

    for (int round = 0; round < 40; ++round) {
        std::vector<primitives::Utxo> inv;
        const size_t n = 1 + next() % 25;
        for (size_t i = 0; i < n; ++i) {
            inv.push_back(make_utxo(100'000 + static_cast<int64_t>(
                                        next() % (20 * COIN)),
                                    static_cast<int>(next() % 100)));
        }
        const Amount target(COIN / 100 +
                            static_cast<int64_t>(next() % (60 * COIN)));

        auto sel = wallet::select_coins_or_change(
            inv, target, model, wallet::DEFAULT_MAX_OVERPAY,
            wallet::DEFAULT_DUST_THRESHOLD);
        if (!sel.ok()) {
            CHECK(sel.error().code() == core::ErrorCode::INSUFFICIENT_FUNDS);
            continue;
        }
        check_selection_invariants(sel.value(), inv, target);
        if (!sel.value().change_permitted &&
            sel.value().strategy != wallet::SelectionStrategy::CHANGE_FALLBACK) {
            CHECK(sel.value().leftover <= wallet::DEFAULT_MAX_OVERPAY);
        }
        if (sel.value().change_permitted) {
            CHECK(sel.value().leftover >= wallet::DEFAULT_DUST_THRESHOLD);
        }
    }
}
