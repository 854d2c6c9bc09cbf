#include "trade_recon/services/position_aggregator.h"

#include <map>
#include <string>
#include <vector>

namespace trade_recon {

std::vector<PositionSummary> PositionAggregator::Aggregate(
    const std::vector<SettledTrade>& settled) {
    std::map<std::string, PositionSummary> by_ticker;
    for (const auto& item : settled) {
        auto& summary = by_ticker[item.trade.ticker];
        summary.ticker = item.trade.ticker;
        summary.signed_balance += SignedQuantity(item.trade);
        summary.realized_result += item.net_result;
    }

    std::vector<PositionSummary> positions;
    positions.reserve(by_ticker.size());
    for (auto& entry : by_ticker) {
        entry.second.realized_result = Round2(entry.second.realized_result);
        positions.push_back(entry.second);
    }
    return positions;
}

std::vector<std::string> PositionAggregator::NegativeTickers(
    const std::vector<PositionSummary>& positions) {
    std::vector<std::string> tickers;
    for (const auto& position : positions) {
        if (position.signed_balance < 0) {
            tickers.push_back(position.ticker);
        }
    }
    return tickers;
}

}  // namespace trade_recon
