// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet/fee_model.h"

#include <algorithm>

namespace wallet {

size_t estimate_tx_size(size_t num_inputs, size_t num_outputs) {
    return TX_BYTES_OVERHEAD +
           num_inputs * TX_BYTES_PER_INPUT +
           num_outputs * TX_BYTES_PER_OUTPUT;
}

primitives::Amount estimate_fee(size_t num_inputs, size_t num_outputs,
                                const primitives::FeeRate& rate,
                                primitives::Amount min_fee) {
    primitives::Amount fee =
        rate.compute_fee(estimate_tx_size(num_inputs, num_outputs));
    return std::max(fee, min_fee);
}

} // namespace wallet
