#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "trade_recon/contracts/types.h"
#include "trade_recon/core/recon_diagnostics.h"

namespace trade_recon {

struct CoverageResult {
    std::vector<Trade> borrowed;
    std::vector<CoverageOutcome> outcomes;
};

// Covers negative balances from prior-period Buy lots, most recent first.
class ShortCoverageResolver {
public:
    explicit ShortCoverageResolver(std::string borrowed_operation_label = "Buy (prior period)")
        : borrowed_operation_label_(std::move(borrowed_operation_label)) {}

    CoverageResult Resolve(const std::vector<PositionSummary>& positions,
                           const std::vector<Trade>& prior_period_trades,
                           DiagnosticLog* diagnostics) const;

    // Newest trade date first.
    static std::vector<const Trade*> CollectLots(const std::string& ticker,
                                                 const std::vector<Trade>& prior_period_trades);

    Trade Borrow(const Trade& lot, std::int64_t use) const;

private:
    std::string borrowed_operation_label_;
};

}  // namespace trade_recon
