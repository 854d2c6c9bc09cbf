#pragma once

#include <string>
#include <vector>

#include "trade_recon/contracts/types.h"

namespace trade_recon {

class PositionAggregator {
public:
    // One summary per ticker, ordered by ticker.
    static std::vector<PositionSummary> Aggregate(const std::vector<SettledTrade>& settled);

    static std::vector<std::string> NegativeTickers(const std::vector<PositionSummary>& positions);
};

}  // namespace trade_recon
