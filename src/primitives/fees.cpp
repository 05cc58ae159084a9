// Copyright (c) 2024-2026 The TXP Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/fees.h"

#include <algorithm>
#include <limits>

namespace primitives {

Amount FeeRate::compute_fee(size_t size) const {
    int64_t rate = fee_per_kb.value();
    if (size == 0 || rate <= 0) return Amount(0);

    // fee = ceil(rate * size / 1000), capped at MAX_MONEY. Sizes whose
    // product would overflow take the cap directly.
    constexpr int64_t LIMIT = std::numeric_limits<int64_t>::max() - 999;
    if (size > static_cast<size_t>(LIMIT / rate))
        return Amount(Amount::MAX_MONEY);
    int64_t sz = static_cast<int64_t>(size);
    int64_t fee = (rate * sz + 999) / 1000;
    return Amount(std::min<int64_t>(fee, Amount::MAX_MONEY));
}

std::string FeeRate::to_string() const {
    return fee_per_kb.to_string() + "/kB";
}

} // namespace primitives
