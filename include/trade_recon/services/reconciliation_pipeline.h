#pragma once

#include <optional>
#include <string>
#include <vector>

#include "trade_recon/contracts/types.h"
#include "trade_recon/core/recon_config.h"
#include "trade_recon/core/recon_diagnostics.h"
#include "trade_recon/services/rate_table.h"

namespace trade_recon {

struct ReconInputs {
    RecordTable trades;
    RecordTable rates;
    std::vector<RecordTable> prior_period_trades;
    std::optional<RecordTable> declared_balances;
};

struct ReconRunResult {
    std::vector<SettledTrade> settled_trades;
    std::vector<PositionSummary> positions;
    std::vector<ClosedPosition> closed_positions;
    std::vector<BalanceComparison> balance_comparison;
    std::vector<BalanceComparison> insufficient_data;
    std::vector<CoverageOutcome> coverage;
    std::size_t borrowed_trade_count{0};
    std::vector<ReconDiagnostic> diagnostics;
};

class ReconciliationPipeline {
public:
    explicit ReconciliationPipeline(ReconConfig config);

    bool Run(const ReconInputs& inputs, ReconRunResult* result, std::string* error) const;

    const ReconConfig& config() const { return config_; }

private:
    bool RunStages(const ReconInputs& inputs, ReconRunResult* result, std::string* error) const;
    bool LoadPriorPeriodLots(const std::vector<RecordTable>& sources,
                             std::vector<Trade>* lots,
                             DiagnosticLog* diagnostics) const;
    void CoverNegativeBalances(const ReconInputs& inputs,
                               const RateTable& rates,
                               ReconRunResult* result,
                               DiagnosticLog* diagnostics) const;
    bool Reconcile(const ReconInputs& inputs,
                   ReconRunResult* result,
                   DiagnosticLog* diagnostics,
                   std::string* error) const;

    ReconConfig config_;
};

}  // namespace trade_recon
