// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Tests for the in-process ledger, snapshot files and inventory loading.

#include "test_framework.h"

#include "core/random.h"
#include "ledger/memory_ledger.h"
#include "ledger/snapshot.h"
#include "wallet/inventory.h"
#include "wallet/utxo_lock.h"

#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <vector>

using primitives::Amount;

namespace {

constexpr int64_t COIN = Amount::COIN;

const std::string TXID_A =
    "1111111111111111111111111111111111111111111111111111111111111111";
const std::string TXID_B =
    "2222222222222222222222222222222222222222222222222222222222222222";

std::filesystem::path temp_path(const std::string& stem) {
    return std::filesystem::temp_directory_path() /
           (stem + "_" + std::to_string(core::get_random_uint64()));
}

} // namespace

// ===========================================================================
// MemoryLedger
// ===========================================================================

TEST_CASE(Ledger, ListUnspentFilters) {
    ledger::MemoryLedger node;
    node.add_output("alice", Amount(COIN), 0);
    node.add_output("alice", Amount(2 * COIN), 6);
    node.add_output("bob", Amount(3 * COIN), 6);

    auto all = node.list_unspent(0, ledger::MAX_CONFIRMATIONS, {});
    CHECK_OK(all);
    CHECK_EQ(all.value().size(), size_t{3});

    auto confirmed = node.list_unspent(1, ledger::MAX_CONFIRMATIONS, {"alice"});
    CHECK_OK(confirmed);
    CHECK_EQ(confirmed.value().size(), size_t{1});
    CHECK_EQ(confirmed.value()[0].amount, Amount(2 * COIN));

    node.confirm_block();
    confirmed = node.list_unspent(1, ledger::MAX_CONFIRMATIONS, {"alice"});
    CHECK_EQ(confirmed.value().size(), size_t{2});
}

TEST_CASE(Ledger, LockOutputConflicts) {
    ledger::MemoryLedger node;
    auto u = node.add_output("alice", Amount(COIN), 1);

    CHECK_OK(node.lock_output(u.outpoint));
    CHECK(node.is_locked(u.outpoint));
    CHECK_ERR_CODE(node.lock_output(u.outpoint),
                   core::ErrorCode::UTXO_LOCK_CONFLICT);

    auto listed = node.list_unspent(0, ledger::MAX_CONFIRMATIONS, {});
    CHECK(listed.value()[0].locked);

    CHECK_OK(node.unlock_output(u.outpoint));
    CHECK(!node.is_locked(u.outpoint));

    auto unknown = primitives::OutPoint(core::get_random_uint256(), 3);
    CHECK_ERR_CODE(node.lock_output(unknown),
                   core::ErrorCode::UTXO_LOCK_CONFLICT);
}

TEST_CASE(Ledger, CreateSignBroadcast) {
    ledger::MemoryLedger node;
    auto u = node.add_output("alice", Amount(10 * COIN), 3);

    std::map<std::string, Amount> outputs{{"bob", Amount(4 * COIN)},
                                          {"change1", Amount(5 * COIN)}};
    auto raw = node.create_transaction({u.outpoint}, outputs);
    CHECK_OK(raw);

    // Unsigned transactions are refused.
    CHECK_ERR(node.broadcast_transaction({raw.value(), true}));

    auto signed_tx = node.sign_transaction(raw.value());
    CHECK_OK(signed_tx);
    CHECK(signed_tx.value().complete);

    auto txid = node.broadcast_transaction(signed_tx.value());
    CHECK_OK(txid);

    CHECK(!node.get_output(u.outpoint).value().has_value());
    auto bob = node.get_output(primitives::OutPoint(txid.value(), 0));
    CHECK(bob.value().has_value());
    CHECK_EQ(bob.value()->address, "bob");
    CHECK_EQ(bob.value()->confirmations, 0);

    auto accepted = node.accepted();
    CHECK_EQ(accepted.size(), size_t{1});
    CHECK_EQ(accepted[0].fee, Amount(COIN));
    CHECK_EQ(accepted[0].txid, txid.value());
}

TEST_CASE(Ledger, CreateRejectsOverspend) {
    ledger::MemoryLedger node;
    auto u = node.add_output("alice", Amount(COIN), 3);
    std::map<std::string, Amount> outputs{{"bob", Amount(2 * COIN)}};
    CHECK_ERR(node.create_transaction({u.outpoint}, outputs));
    CHECK_ERR(node.create_transaction({}, outputs));
}

TEST_CASE(Ledger, BroadcastRejectsSpentInputs) {
    ledger::MemoryLedger node;
    auto u = node.add_output("alice", Amount(2 * COIN), 3);
    std::map<std::string, Amount> outputs{{"bob", Amount(COIN)}};

    auto raw = node.create_transaction({u.outpoint}, outputs);
    auto signed_tx = node.sign_transaction(raw.value());
    node.remove_output(u.outpoint);
    CHECK_ERR(node.broadcast_transaction(signed_tx.value()));
    CHECK(node.accepted().empty());
}

TEST_CASE(Ledger, FailureInjection) {
    ledger::MemoryLedger node;
    node.fail_next(ledger::MemoryLedger::Operation::LIST_UNSPENT,
                   core::ErrorCode::NETWORK_TIMEOUT, 2);

    CHECK_ERR_CODE(node.list_unspent(0, 10, {}), core::ErrorCode::NETWORK_TIMEOUT);
    CHECK_ERR_CODE(node.list_unspent(0, 10, {}), core::ErrorCode::NETWORK_TIMEOUT);
    CHECK_OK(node.list_unspent(0, 10, {}));
    CHECK_EQ(node.call_count(ledger::MemoryLedger::Operation::LIST_UNSPENT),
             size_t{3});

    node.set_sign_incomplete(true);
    auto u = node.add_output("alice", Amount(2 * COIN), 3);
    auto raw = node.create_transaction({u.outpoint}, {{"bob", Amount(COIN)}});
    auto signed_tx = node.sign_transaction(raw.value());
    CHECK(!signed_tx.value().complete);
    CHECK_ERR(node.broadcast_transaction(signed_tx.value()));
}

TEST_CASE(Ledger, ChangeAddresses) {
    ledger::MemoryLedger node;
    CHECK_EQ(node.get_change_address().value(), "change1");
    CHECK_EQ(node.get_change_address().value(), "change2");
    node.set_change_address("mychange");
    CHECK_EQ(node.get_change_address().value(), "mychange");
    CHECK_EQ(ledger::operation_name(
                 ledger::MemoryLedger::Operation::GET_CHANGE_ADDRESS),
             "getrawchangeaddress");
}

// ===========================================================================
// Snapshot files
// ===========================================================================

TEST_CASE(Snapshot, ParseLine) {
    auto parsed = ledger::parse_snapshot_line(TXID_A + ":1  alice  12.5  6");
    CHECK_OK(parsed);
    CHECK(parsed.value().has_value());
    const auto& u = *parsed.value();
    CHECK_EQ(u.outpoint.n, uint32_t{1});
    CHECK_EQ(u.address, "alice");
    CHECK_EQ(u.amount.value(), int64_t{1'250'000'000});
    CHECK_EQ(u.confirmations, 6);
    CHECK(!u.locked);

    auto locked = ledger::parse_snapshot_line(TXID_B + ":0\tbob\t1\t0\tlocked\r");
    CHECK_OK(locked);
    CHECK(locked.value()->locked);
}

TEST_CASE(Snapshot, ParseSkipsCommentsAndBlanks) {
    CHECK(!ledger::parse_snapshot_line("").value().has_value());
    CHECK(!ledger::parse_snapshot_line("   ").value().has_value());
    CHECK(!ledger::parse_snapshot_line("# comment").value().has_value());
}

TEST_CASE(Snapshot, ParseRejectsMalformed) {
    CHECK_ERR(ledger::parse_snapshot_line(TXID_A + ":0 alice 1"));
    CHECK_ERR(ledger::parse_snapshot_line(TXID_A + ":0 alice 1 -3"));
    CHECK_ERR(ledger::parse_snapshot_line(TXID_A + ":0 alice one 3"));
    CHECK_ERR(ledger::parse_snapshot_line(TXID_A + ":0 alice 1 3 frozen"));
    CHECK_ERR(ledger::parse_snapshot_line("nottxid:0 alice 1 3"));
}

TEST_CASE(Snapshot, SaveAndLoad) {
    auto path = temp_path("txplan_snapshot");

    ledger::MemoryLedger source;
    source.add_output("alice", Amount(50 * COIN), 10);
    auto locked = source.add_output("bob", Amount(COIN / 4), 2);
    CHECK_OK(source.lock_output(locked.outpoint));
    CHECK_OK(ledger::save_snapshot(path, source.outputs()));

    ledger::MemoryLedger loaded;
    auto count = ledger::load_snapshot(path, loaded);
    CHECK_OK(count);
    CHECK_EQ(count.value(), size_t{2});
    CHECK_EQ(loaded.output_count(), size_t{2});
    CHECK(loaded.is_locked(locked.outpoint));

    std::filesystem::remove(path);
}

TEST_CASE(Snapshot, LoadReportsLineNumber) {
    auto path = temp_path("txplan_bad_snapshot");
    {
        std::ofstream out(path);
        out << "# header\n" << TXID_A << ":0 alice 1 3\n" << "garbage\n";
    }
    ledger::MemoryLedger node;
    auto count = ledger::load_snapshot(path, node);
    CHECK_ERR(count);
    CHECK(count.error().message().find("line 3") != std::string::npos);
    std::filesystem::remove(path);

    CHECK_ERR_CODE(ledger::load_snapshot("/nonexistent/utxos.txt", node),
                   core::ErrorCode::STORAGE_NOT_FOUND);
}

// ===========================================================================
// Inventory
// ===========================================================================

TEST_CASE(Inventory, FiltersUnspendable) {
    ledger::MemoryLedger node;
    auto good = node.add_output("alice", Amount(COIN), 3);
    node.add_output("alice", Amount(COIN), 0);                 // unconfirmed
    auto pinned = node.add_output("alice", Amount(COIN), 3);   // node-locked
    node.add_output("carol", Amount(COIN), 3);                 // other owner
    auto held = node.add_output("alice", Amount(COIN), 3);     // table-locked
    CHECK_OK(node.lock_output(pinned.outpoint));

    wallet::UtxoLockTable table;
    auto lock = table.try_acquire({held.outpoint}, 60);
    CHECK_OK(lock);

    auto inv = wallet::load_inventory(node, {"alice"}, 1, &table);
    CHECK_OK(inv);
    CHECK_EQ(inv.value().size(), size_t{1});
    CHECK(inv.value()[0].outpoint == good.outpoint);
    CHECK_EQ(wallet::inventory_total(inv.value()), Amount(COIN));

    auto without_table = wallet::load_inventory(node, {"alice"}, 1);
    CHECK_EQ(without_table.value().size(), size_t{2});

    auto bookkeeping = wallet::load_inventory(
        node, {}, wallet::INVENTORY_BOOKKEEPING_MIN_CONF);
    CHECK_EQ(bookkeeping.value().size(), size_t{4});
}

TEST_CASE(Inventory, NodeFailureIsNotAnEmptyInventory) {
    ledger::MemoryLedger node;
    node.add_output("alice", Amount(COIN), 3);
    node.fail_next(ledger::MemoryLedger::Operation::LIST_UNSPENT);

    CHECK_ERR_CODE(wallet::load_inventory(node, {}, 1),
                   core::ErrorCode::INVENTORY_UNAVAILABLE);
    CHECK_EQ(wallet::load_inventory(node, {}, 1).value().size(), size_t{1});
}
