// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// txplan -- offline coin-selection and transaction planning CLI
//
// Loads a UTXO snapshot into an in-process ledger and runs the payment
// planner against it.
//
// Usage:
//   txplan [options] <command> [args...]
//
// Commands:
//   listunspent             List spendable outputs
//   balance                 Show spendable balance
//   plan <addr> <amt>       Show the plan for a payment
//   estimate <amt>          Show the fee of a payment
//   send <addr> <amt>       Plan, sign and broadcast a payment
//   consolidate <addr>      Merge small outputs into one
//
// Options:
//   -snapshot=FILE          UTXO snapshot (required)
//   -conf=FILE              Config file (key=value per line)
//   -from=ADDR              Spend only from ADDR (repeatable)
//   -changeaddress=ADDR     Fixed change address
//   -commit                 Write the updated snapshot after send/consolidate
//   -loglevel=LEVEL         trace|debug|info|warn|error|fatal
//   -debug=CAT              Debug output for CAT only (repeatable)
//   -logfile=FILE           Also log to FILE
//   plus every planner option (feerate, minfee, dustthreshold, ...)
// ---------------------------------------------------------------------------

#include "core/config.h"
#include "core/error.h"
#include "core/logging.h"
#include "ledger/memory_ledger.h"
#include "ledger/snapshot.h"
#include "primitives/amount.h"
#include "wallet/assemble.h"
#include "wallet/inventory.h"
#include "wallet/options.h"
#include "wallet/planner.h"
#include "wallet/utxo_lock.h"

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static void print_usage() {
    std::cout << "txplan\n\n"
              << "Usage: txplan [options] <command> [args...]\n\n"
              << "Commands:\n"
              << "  listunspent             List spendable outputs\n"
              << "  balance                 Show spendable balance\n"
              << "  plan <addr> <amt>       Show the plan for a payment\n"
              << "  estimate <amt>          Show the fee of a payment\n"
              << "  send <addr> <amt>       Plan, sign and broadcast a payment\n"
              << "  consolidate <addr>      Merge small outputs into one\n\n"
              << "Options:\n"
              << "  -snapshot=FILE          UTXO snapshot (required)\n"
              << "  -conf=FILE              Config file\n"
              << "  -from=ADDR              Spend only from ADDR (repeatable)\n"
              << "  -changeaddress=ADDR     Fixed change address\n"
              << "  -commit                 Save the snapshot after sending\n"
              << "  -feerate=AMT            Fee per kB (default 0.01)\n"
              << "  -minfee=AMT             Fee floor (default 0.001)\n"
              << "  -dustthreshold=AMT      Smallest output (default 0.001)\n"
              << "  -maxoverpay=AMT         Change-free tolerance (default 0.01)\n"
              << "  -maxfee=AMT             Fee cap\n"
              << "  -minconf=N              Minimum confirmations (default 1)\n"
              << "  -consolidatethreshold=AMT  Small output bound (default 1)\n"
              << "  -consolidatemaxinputs=N    Inputs per consolidation (default 100)\n"
              << "  -loglevel=LEVEL  -debug=CAT  -logfile=FILE\n\n"
              << "Examples:\n"
              << "  txplan -snapshot=utxos.txt -from=DAddr plan DDest 12.5\n"
              << "  txplan -snapshot=utxos.txt -commit consolidate DAddr\n";
}

static void print_plan(const wallet::TxPlan& plan) {
    std::cout << "Inputs (" << plan.inputs.size() << "):" << std::endl;
    for (const auto& op : plan.inputs) {
        std::cout << "  " << op.to_string() << std::endl;
    }
    std::cout << "Outputs:" << std::endl;
    for (const auto& [address, amount] : plan.outputs) {
        bool change = plan.change_address && *plan.change_address == address;
        std::cout << "  " << address << "  " << amount.to_string()
                  << (change ? "  [change]" : "") << std::endl;
    }
    std::cout << "Input total: " << plan.input_total.to_string() << std::endl;
    std::cout << "Fee:         " << plan.fee.to_string() << std::endl;
}

static int report(const wallet::SelectionFailure& failure) {
    std::cerr << "Error: " << failure.format() << std::endl;
    return 1;
}

static int report(const core::Error& err) {
    std::cerr << "Error: " << err.message() << std::endl;
    return 1;
}

static core::Result<void> init_logging(const core::Config& config) {
    auto& logger = core::Logger::instance();

    if (auto level = config.get(core::CONF_LOGLEVEL)) {
        auto parsed = core::parse_log_level(*level);
        if (!parsed) {
            return core::Error(core::ErrorCode::VALIDATION_ERROR,
                               "Unknown log level '" + *level + "'");
        }
        logger.set_level(*parsed);
    }

    // -debug=<cat> narrows output to the named categories at debug level.
    auto debug = config.get_list(core::CONF_DEBUG);
    if (!debug.empty()) {
        uint32_t mask = 0;
        for (const auto& name : debug) {
            auto cat = core::parse_log_category(name);
            if (!cat) {
                return core::Error(core::ErrorCode::VALIDATION_ERROR,
                                   "Unknown log category '" + name + "'");
            }
            mask |= static_cast<uint32_t>(*cat);
        }
        logger.set_categories(mask);
        if (!config.get(core::CONF_LOGLEVEL)) {
            logger.set_level(core::LogLevel::DEBUG);
        }
    }

    if (auto file = config.get(core::CONF_LOGFILE)) {
        if (!logger.set_log_file(*file)) {
            return core::Error(core::ErrorCode::STORAGE_ERROR,
                               "Cannot open log file '" + *file + "'");
        }
        logger.set_print_to_file(true);
    }
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

static int cmd_listunspent(ledger::MemoryLedger& node,
                           const std::vector<std::string>& from,
                           const wallet::PlannerOptions& options) {
    auto inventory = wallet::load_inventory(node, from,
                                            options.min_confirmations);
    if (!inventory.ok()) return report(inventory.error());

    if (inventory.value().empty()) {
        std::cout << "No unspent outputs." << std::endl;
        return 0;
    }
    std::cout << "Unspent outputs (" << inventory.value().size() << "):"
              << std::endl;
    for (const auto& u : inventory.value()) {
        std::cout << "  " << u.outpoint.to_string() << "  " << u.address
                  << "  " << u.amount.to_string()
                  << "  conf=" << u.confirmations << std::endl;
    }
    std::cout << "Total: "
              << wallet::inventory_total(inventory.value()).to_string()
              << std::endl;
    return 0;
}

static int cmd_balance(ledger::MemoryLedger& node,
                       const std::vector<std::string>& from) {
    auto spendable = wallet::load_inventory(node, from, 1);
    if (!spendable.ok()) return report(spendable.error());
    auto all = wallet::load_inventory(node, from,
                                      wallet::INVENTORY_BOOKKEEPING_MIN_CONF);
    if (!all.ok()) return report(all.error());

    std::cout << "Balance: "
              << wallet::inventory_total(spendable.value()).to_string()
              << "  (" << spendable.value().size() << " outputs)"
              << std::endl;
    std::cout << "Including unconfirmed: "
              << wallet::inventory_total(all.value()).to_string()
              << std::endl;
    return 0;
}

static int cmd_estimate(wallet::PaymentPlanner& planner,
                        const std::vector<std::string>& from,
                        const std::string& amount_str) {
    auto amount = wallet::parse_payment_amount(amount_str, planner.options());
    if (!amount.ok()) return report(amount.error());

    auto estimate = planner.estimate_fee(from, amount.value());
    if (!estimate.ok()) return report(estimate.error());

    std::cout << "Fee:      " << estimate.value().fee.to_string() << std::endl;
    std::cout << "Inputs:   " << estimate.value().num_inputs << std::endl;
    std::cout << "Change:   "
              << (estimate.value().can_avoid_change ? "none" : "required")
              << std::endl;
    return 0;
}

static int cmd_plan(wallet::PaymentPlanner& planner,
                    const std::vector<std::string>& from,
                    const std::string& dest,
                    const std::string& amount_str) {
    auto amount = wallet::parse_payment_amount(amount_str, planner.options());
    if (!amount.ok()) return report(amount.error());

    auto plan = planner.select_and_plan(from, dest, amount.value());
    if (!plan.ok()) return report(plan.error());

    print_plan(plan.value());
    return 0;
}

static int cmd_send(wallet::PaymentPlanner& planner,
                    const std::vector<std::string>& from,
                    const std::string& dest,
                    const std::string& amount_str) {
    auto amount = wallet::parse_payment_amount(amount_str, planner.options());
    if (!amount.ok()) return report(amount.error());

    wallet::TargetPayment payment{dest, amount.value(), std::nullopt};
    auto sent = planner.send(from, payment);
    if (!sent.ok()) return report(sent.error());

    print_plan(sent.value().plan);
    std::cout << "Txid:        " << sent.value().txid.to_hex() << std::endl;
    return 0;
}

static int cmd_consolidate(wallet::PaymentPlanner& planner,
                           const std::vector<std::string>& from,
                           const std::string& dest) {
    auto sent = planner.consolidate(from, dest);
    if (!sent.ok()) return report(sent.error());

    print_plan(sent.value().plan);
    std::cout << "Txid:        " << sent.value().txid.to_hex() << std::endl;
    return 0;
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main(int argc, char* argv[]) {
    core::Config config;
    config.parse_args(argc, argv);

    const auto& args = config.positionals();
    if (args.empty()) {
        print_usage();
        return 0;
    }

    if (auto conf = config.get(core::CONF_CONF)) {
        auto loaded = config.parse_file(*conf);
        if (!loaded.ok()) return report(loaded.error());
    }

    auto logging = init_logging(config);
    if (!logging.ok()) return report(logging.error());

    auto options = wallet::PlannerOptions::from_config(config);
    if (!options.ok()) return report(options.error());

    auto snapshot = config.get(core::CONF_SNAPSHOT);
    if (!snapshot) {
        std::cerr << "Error: -snapshot=FILE is required" << std::endl;
        return 1;
    }

    ledger::MemoryLedger node;
    auto loaded = ledger::load_snapshot(*snapshot, node);
    if (!loaded.ok()) return report(loaded.error());

    if (auto change = config.get(core::CONF_CHANGEADDRESS)) {
        node.set_change_address(*change);
    }

    wallet::UtxoLockTable locks;
    wallet::PaymentPlanner planner(node, locks, options.value());
    const std::vector<std::string> from = config.get_list(core::CONF_FROM);

    const std::string& command = args[0];
    auto arg = [&](size_t i) -> std::string {
        return i < args.size() ? args[i] : std::string{};
    };

    int rc = 0;
    bool mutates = false;
    if (command == "listunspent") {
        rc = cmd_listunspent(node, from, options.value());
    } else if (command == "balance") {
        rc = cmd_balance(node, from);
    } else if (command == "estimate") {
        if (arg(1).empty()) {
            std::cerr << "Usage: txplan estimate <amount>" << std::endl;
            return 1;
        }
        rc = cmd_estimate(planner, from, arg(1));
    } else if (command == "plan" || command == "send") {
        if (arg(1).empty() || arg(2).empty()) {
            std::cerr << "Usage: txplan " << command << " <address> <amount>"
                      << std::endl;
            return 1;
        }
        if (command == "plan") {
            rc = cmd_plan(planner, from, arg(1), arg(2));
        } else {
            rc = cmd_send(planner, from, arg(1), arg(2));
            mutates = true;
        }
    } else if (command == "consolidate") {
        if (arg(1).empty()) {
            std::cerr << "Usage: txplan consolidate <address>" << std::endl;
            return 1;
        }
        rc = cmd_consolidate(planner, from, arg(1));
        mutates = true;
    } else {
        std::cerr << "Unknown command: " << command << std::endl;
        print_usage();
        return 1;
    }

    if (rc == 0 && mutates && config.get_bool(core::CONF_COMMIT, false)) {
        auto saved = ledger::save_snapshot(*snapshot, node.outputs());
        if (!saved.ok()) return report(saved.error());
        std::cout << "Snapshot updated: " << *snapshot << std::endl;
    }

    locks.clear();
    core::Logger::instance().flush();
    return rc;
}
