#pragma once

#include <string>
#include <utility>
#include <vector>

#include "trade_recon/contracts/types.h"

namespace trade_recon {

class ClosedPositionResolver {
public:
    explicit ClosedPositionResolver(std::string total_row_label = "Total")
        : total_row_label_(std::move(total_row_label)) {}

    // Zero-balance tickers plus a total row.
    std::vector<ClosedPosition> Resolve(const std::vector<SettledTrade>& settled,
                                        const std::vector<PositionSummary>& positions) const;

private:
    std::string total_row_label_;
};

}  // namespace trade_recon
