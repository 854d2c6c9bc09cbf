#include "trade_recon/services/short_coverage_resolver.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace trade_recon {

std::vector<const Trade*> ShortCoverageResolver::CollectLots(
    const std::string& ticker,
    const std::vector<Trade>& prior_period_trades) {
    std::vector<const Trade*> lots;
    for (const auto& trade : prior_period_trades) {
        if (trade.ticker == ticker && trade.operation == OperationTag::kBuy) {
            lots.push_back(&trade);
        }
    }
    std::stable_sort(lots.begin(), lots.end(), [](const Trade* lhs, const Trade* rhs) {
        if (lhs->trade_date != rhs->trade_date) {
            return lhs->trade_date > rhs->trade_date;
        }
        return lhs->settlement_date > rhs->settlement_date;
    });
    return lots;
}

Trade ShortCoverageResolver::Borrow(const Trade& lot, std::int64_t use) const {
    const Decimal used = Decimal::FromInt(use);
    const Decimal available = Decimal::FromInt(lot.quantity);
    Trade borrowed = lot;
    borrowed.operation = OperationTag::kBuy;
    borrowed.operation_label = borrowed_operation_label_;
    borrowed.origin = TradeOrigin::kPriorPeriod;
    borrowed.quantity = use;
    borrowed.amount = Round2(lot.amount * used / available);
    borrowed.commission = Round2(lot.commission * used / available);
    borrowed.applied_rate.reset();
    return borrowed;
}

CoverageResult ShortCoverageResolver::Resolve(const std::vector<PositionSummary>& positions,
                                              const std::vector<Trade>& prior_period_trades,
                                              DiagnosticLog* diagnostics) const {
    CoverageResult result;
    for (const auto& position : positions) {
        if (position.signed_balance >= 0) {
            continue;
        }

        CoverageOutcome outcome;
        outcome.ticker = position.ticker;
        outcome.shortfall = -position.signed_balance;

        for (const Trade* lot : CollectLots(position.ticker, prior_period_trades)) {
            if (outcome.consumed >= outcome.shortfall) {
                break;
            }
            if (lot->quantity <= 0) {
                if (diagnostics != nullptr) {
                    diagnostics->Record(ReconErrorCode::kRowParse,
                                        DiagnosticLevel::kWarn,
                                        "prior_period",
                                        "skipped zero-quantity lot",
                                        lot->ticker,
                                        lot->source_row);
                }
                continue;
            }
            const std::int64_t use = std::min(lot->quantity, outcome.shortfall - outcome.consumed);
            result.borrowed.push_back(Borrow(*lot, use));
            outcome.consumed += use;
            ++outcome.lots_used;
        }

        outcome.residual = outcome.shortfall - outcome.consumed;
        if (outcome.residual > 0 && diagnostics != nullptr) {
            diagnostics->Record(ReconErrorCode::kInsufficientPriorData,
                                DiagnosticLevel::kWarn,
                                "prior_period",
                                "prior-period lots cover " + std::to_string(outcome.consumed) +
                                    " of " + std::to_string(outcome.shortfall) + "; " +
                                    std::to_string(outcome.residual) + " remain uncovered",
                                position.ticker);
        }
        result.outcomes.push_back(std::move(outcome));
    }
    return result;
}

}  // namespace trade_recon
