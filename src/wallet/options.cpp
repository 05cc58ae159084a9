// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet/options.h"
#include "core/logging.h"

#include <string>

namespace wallet {

namespace {

/// Parse an optional decimal coin value from the config.
core::Result<std::optional<primitives::Amount>> get_amount(
    const core::Config& config, const char* key) {
    auto text = config.get(key);
    if (!text) {
        return std::optional<primitives::Amount>{};
    }
    auto parsed = primitives::Amount::parse(*text);
    if (!parsed.ok()) {
        return core::Error(parsed.error().code(),
                           "Config: invalid amount for '" +
                           std::string(key) + "': " +
                           parsed.error().message());
    }
    return std::optional<primitives::Amount>{parsed.value()};
}

} // namespace

core::Result<PlannerOptions> PlannerOptions::from_config(
    const core::Config& config) {
    PlannerOptions opts;

    TXP_TRY_ASSIGN(feerate, get_amount(config, core::CONF_FEERATE));
    if (feerate) opts.fee_model.rate = primitives::FeeRate(*feerate);

    TXP_TRY_ASSIGN(minfee, get_amount(config, core::CONF_MINFEE));
    if (minfee) opts.fee_model.min_fee = *minfee;

    TXP_TRY_ASSIGN(dust, get_amount(config, core::CONF_DUSTTHRESHOLD));
    if (dust) opts.dust_threshold = *dust;

    TXP_TRY_ASSIGN(overpay, get_amount(config, core::CONF_MAXOVERPAY));
    if (overpay) opts.max_overpay = *overpay;

    TXP_TRY_ASSIGN(maxfee, get_amount(config, core::CONF_MAXFEE));
    opts.max_fee = maxfee;

    TXP_TRY_ASSIGN(threshold,
                   get_amount(config, core::CONF_CONSOLIDATETHRESHOLD));
    if (threshold) opts.consolidate_threshold = *threshold;

    TXP_TRY_ASSIGN(minpayment, get_amount(config, core::CONF_MINPAYMENT));
    if (minpayment) opts.min_payment = *minpayment;

    TXP_TRY_ASSIGN(maxpayment, get_amount(config, core::CONF_MAXPAYMENT));
    if (maxpayment) opts.max_payment = *maxpayment;

    TXP_TRY_ASSIGN(minconf, config.get_int(core::CONF_MINCONF,
                                           DEFAULT_MIN_CONFIRMATIONS));
    if (minconf < 0 || minconf > 9'999'999) {
        return core::Error(core::ErrorCode::VALIDATION_RANGE,
                           "Config: minconf out of range: " +
                           std::to_string(minconf));
    }
    opts.min_confirmations = static_cast<int>(minconf);

    TXP_TRY_ASSIGN(timeout, config.get_int(core::CONF_LOCKTIMEOUT,
                                           DEFAULT_LOCK_TIMEOUT));
    opts.lock_timeout = timeout;

    TXP_TRY_ASSIGN(max_inputs, config.get_int(
        core::CONF_CONSOLIDATEMAXINPUTS,
        static_cast<int64_t>(DEFAULT_CONSOLIDATE_MAX_INPUTS)));
    if (max_inputs < 0) {
        return core::Error(core::ErrorCode::VALIDATION_RANGE,
                           "Config: consolidatemaxinputs must not be "
                           "negative");
    }
    opts.consolidate_max_inputs = static_cast<size_t>(max_inputs);

    TXP_TRY_VOID(opts.validate());

    LOG_DEBUG(core::LogCategory::CONFIG,
              "Planner options: feerate=" + opts.fee_model.rate.to_string() +
              " dust=" + opts.dust_threshold.to_string() +
              " maxoverpay=" + opts.max_overpay.to_string());
    return opts;
}

core::Result<void> PlannerOptions::validate() const {
    if (fee_model.rate.fee_per_kb.value() < 0 ||
        !fee_model.rate.fee_per_kb.is_valid()) {
        return core::Error(core::ErrorCode::VALIDATION_RANGE,
                           "feerate out of range");
    }
    if (!fee_model.min_fee.is_valid()) {
        return core::Error(core::ErrorCode::VALIDATION_RANGE,
                           "minfee out of range");
    }
    if (dust_threshold.value() <= 0) {
        return core::Error(core::ErrorCode::VALIDATION_RANGE,
                           "dustthreshold must be positive");
    }
    if (!max_overpay.is_valid()) {
        return core::Error(core::ErrorCode::VALIDATION_RANGE,
                           "maxoverpay out of range");
    }
    if (max_fee && *max_fee < fee_model.min_fee) {
        return core::Error(core::ErrorCode::VALIDATION_ERROR,
                           "maxfee " + max_fee->to_string() +
                           " is below minfee " +
                           fee_model.min_fee.to_string());
    }
    if (lock_timeout <= 0) {
        return core::Error(core::ErrorCode::VALIDATION_RANGE,
                           "locktimeout must be positive");
    }
    if (consolidate_max_inputs < 2) {
        return core::Error(core::ErrorCode::VALIDATION_RANGE,
                           "consolidatemaxinputs must be at least 2");
    }
    if (consolidate_threshold <= dust_threshold) {
        return core::Error(core::ErrorCode::VALIDATION_ERROR,
                           "consolidatethreshold must exceed dustthreshold");
    }
    if (min_payment < dust_threshold) {
        return core::Error(core::ErrorCode::VALIDATION_ERROR,
                           "minpayment " + min_payment.to_string() +
                           " is below dustthreshold " +
                           dust_threshold.to_string());
    }
    if (max_payment < min_payment) {
        return core::Error(core::ErrorCode::VALIDATION_ERROR,
                           "maxpayment is below minpayment");
    }
    return core::make_ok();
}

} // namespace wallet
