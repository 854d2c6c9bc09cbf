#pragma once

#include <optional>
#include <vector>

#include "trade_recon/contracts/types.h"
#include "trade_recon/core/recon_diagnostics.h"
#include "trade_recon/services/rate_table.h"

namespace trade_recon {

class SettlementCalculator {
public:
    // rub_amount     = round2(amount * rate), negated for Buy
    // rub_commission = round2(commission * rate)
    // net_result     = round2(rub_amount - rub_commission)
    static SettledTrade Settle(const Trade& trade, const Decimal& rate);

    // Ordered by settlement date. No preceding rate settles at 0.
    static std::vector<SettledTrade> SettleAll(const std::vector<Trade>& trades,
                                               const RateTable& rates,
                                               DiagnosticLog* diagnostics);

    static std::vector<SettledTrade> SettlePending(const std::vector<Trade>& trades,
                                                   const RateTable& rates,
                                                   DiagnosticLog* diagnostics);

private:
    static SettledTrade SettleWithFallback(const Trade& trade,
                                           const std::optional<Decimal>& rate,
                                           DiagnosticLog* diagnostics);
};

}  // namespace trade_recon
