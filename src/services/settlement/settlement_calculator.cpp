#include "trade_recon/services/settlement_calculator.h"

#include <algorithm>
#include <numeric>
#include <string>
#include <vector>

namespace trade_recon {

SettledTrade SettlementCalculator::Settle(const Trade& trade, const Decimal& rate) {
    SettledTrade settled;
    settled.trade = trade;
    settled.trade.applied_rate = rate;

    const Decimal amount = Round2(trade.amount * rate);
    settled.rub_amount = trade.operation == OperationTag::kBuy ? -amount : amount;
    settled.rub_commission = Round2(trade.commission * rate);
    settled.net_result = Round2(settled.rub_amount - settled.rub_commission);
    return settled;
}

SettledTrade SettlementCalculator::SettleWithFallback(const Trade& trade,
                                                      const std::optional<Decimal>& rate,
                                                      DiagnosticLog* diagnostics) {
    if (rate.has_value()) {
        return Settle(trade, *rate);
    }
    if (diagnostics != nullptr) {
        diagnostics->Record(ReconErrorCode::kNoRateFound,
                            DiagnosticLevel::kWarn,
                            trade.origin == TradeOrigin::kPriorPeriod ? "prior_period" : "trades",
                            "no rate on or before settlement date " +
                                trade.settlement_date.ToDate() +
                                "; settled at rate 0",
                            trade.ticker,
                            trade.source_row);
    }
    SettledTrade settled = Settle(trade, Decimal());
    settled.rate_fallback = true;
    return settled;
}

std::vector<SettledTrade> SettlementCalculator::SettleAll(const std::vector<Trade>& trades,
                                                          const RateTable& rates,
                                                          DiagnosticLog* diagnostics) {
    const auto resolved = rates.ResolveAsOf(trades);

    std::vector<std::size_t> order(trades.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&trades](std::size_t lhs, std::size_t rhs) {
        return trades[lhs].settlement_date < trades[rhs].settlement_date;
    });

    std::vector<SettledTrade> settled;
    settled.reserve(trades.size());
    for (const std::size_t index : order) {
        settled.push_back(SettleWithFallback(trades[index], resolved[index], diagnostics));
    }
    return settled;
}

std::vector<SettledTrade> SettlementCalculator::SettlePending(const std::vector<Trade>& trades,
                                                              const RateTable& rates,
                                                              DiagnosticLog* diagnostics) {
    std::vector<SettledTrade> settled;
    settled.reserve(trades.size());
    for (const auto& trade : trades) {
        if (trade.applied_rate.has_value()) {
            settled.push_back(Settle(trade, *trade.applied_rate));
            continue;
        }
        settled.push_back(
            SettleWithFallback(trade, rates.Lookup(trade.settlement_date), diagnostics));
    }
    return settled;
}

}  // namespace trade_recon
