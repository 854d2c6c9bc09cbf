#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "trade_recon/contracts/types.h"
#include "trade_recon/core/recon_diagnostics.h"

namespace trade_recon {

class ReconciliationChecker {
public:
    // (computed == 0 and declared absent) or computed == declared.
    static bool IsSufficient(std::int64_t computed_balance,
                             const std::optional<std::int64_t>& declared_balance);

    // Outer join of computed and declared balances, ordered by ticker.
    static std::vector<BalanceComparison> Compare(const std::vector<PositionSummary>& positions,
                                                  const std::vector<DeclaredBalance>& declared);

    // Rows failing IsSufficient.
    static std::vector<BalanceComparison> Insufficient(
        const std::vector<BalanceComparison>& comparison);
};

// A blank balance cell is an absent balance.
bool BuildDeclaredBalances(const RecordTable& records,
                           std::vector<DeclaredBalance>* out,
                           DiagnosticLog* diagnostics,
                           std::string* error);

}  // namespace trade_recon
