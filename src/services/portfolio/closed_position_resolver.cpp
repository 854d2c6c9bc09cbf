#include "trade_recon/services/closed_position_resolver.h"

#include <map>
#include <string>
#include <vector>

namespace trade_recon {

std::vector<ClosedPosition> ClosedPositionResolver::Resolve(
    const std::vector<SettledTrade>& settled,
    const std::vector<PositionSummary>& positions) const {
    std::map<std::string, ClosedPosition> closed;
    for (const auto& position : positions) {
        if (position.signed_balance == 0) {
            closed[position.ticker].ticker = position.ticker;
        }
    }
    if (closed.empty()) {
        return {};
    }

    for (const auto& item : settled) {
        const auto it = closed.find(item.trade.ticker);
        if (it == closed.end()) {
            continue;
        }
        ClosedPosition& row = it->second;
        if (item.trade.operation == OperationTag::kBuy) {
            row.total_buys -= item.rub_amount;
        } else if (item.trade.operation == OperationTag::kSell) {
            row.total_sells += item.rub_amount;
        }
        row.total_commission += item.rub_commission;
    }

    std::vector<ClosedPosition> rows;
    rows.reserve(closed.size() + 1);
    ClosedPosition total;
    total.ticker = total_row_label_;
    total.is_total = true;
    for (auto& entry : closed) {
        ClosedPosition& row = entry.second;
        row.total_buys = Round2(row.total_buys);
        row.total_sells = Round2(row.total_sells);
        row.total_commission = Round2(row.total_commission);
        row.net_result = Round2(row.total_sells - row.total_buys - row.total_commission);

        total.total_buys += row.total_buys;
        total.total_sells += row.total_sells;
        total.total_commission += row.total_commission;
        total.net_result += row.net_result;
        rows.push_back(row);
    }
    rows.push_back(total);
    return rows;
}

}  // namespace trade_recon
