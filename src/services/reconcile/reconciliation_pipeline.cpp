#include "trade_recon/services/reconciliation_pipeline.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "trade_recon/core/structured_log.h"
#include "trade_recon/services/closed_position_resolver.h"
#include "trade_recon/services/position_aggregator.h"
#include "trade_recon/services/reconciliation_checker.h"
#include "trade_recon/services/settlement_calculator.h"
#include "trade_recon/services/short_coverage_resolver.h"
#include "trade_recon/services/trade_normalizer.h"

namespace trade_recon {
namespace {

constexpr const char* kApp = "trade_recon";

}  // namespace

ReconciliationPipeline::ReconciliationPipeline(ReconConfig config) : config_(std::move(config)) {}

bool ReconciliationPipeline::Run(const ReconInputs& inputs,
                                 ReconRunResult* result,
                                 std::string* error) const {
    if (result == nullptr) {
        if (error != nullptr) {
            *error = "reconciliation result pointer is null";
        }
        return false;
    }
    if (!ReconConfigValidator::Validate(config_, error)) {
        return false;
    }
    if (inputs.trades.rows.empty()) {
        if (error != nullptr) {
            *error = FormatFatal(ReconErrorCode::kEmptyInput, "trade table has no rows");
        }
        return false;
    }
    if (inputs.rates.rows.empty()) {
        if (error != nullptr) {
            *error = FormatFatal(ReconErrorCode::kEmptyInput, "rate table has no rows");
        }
        return false;
    }

    try {
        return RunStages(inputs, result, error);
    } catch (const std::overflow_error& ex) {
        if (error != nullptr) {
            *error = FormatFatal(ReconErrorCode::kOverflow, ex.what());
        }
        return false;
    }
}

bool ReconciliationPipeline::RunStages(const ReconInputs& inputs,
                                       ReconRunResult* result,
                                       std::string* error) const {
    DiagnosticLog diagnostics(&config_.log);
    ReconRunResult run;

    RateTable rates;
    if (!BuildRateTable(inputs.rates, config_, &rates, &diagnostics, error)) {
        return false;
    }
    EmitStructuredLog(&config_.log,
                      kApp,
                      "info",
                      "rates_loaded",
                      {{"rows", std::to_string(inputs.rates.rows.size())},
                       {"entries", std::to_string(rates.size())}});

    const TradeNormalizer normalizer(config_);
    std::vector<Trade> trades;
    if (!normalizer.Normalize(
            inputs.trades, TradeOrigin::kCurrentPeriod, "trades", &trades, &diagnostics, error)) {
        return false;
    }
    EmitStructuredLog(&config_.log,
                      kApp,
                      "info",
                      "trades_normalized",
                      {{"rows", std::to_string(inputs.trades.rows.size())},
                       {"trades", std::to_string(trades.size())}});

    run.settled_trades = SettlementCalculator::SettleAll(trades, rates, &diagnostics);
    run.positions = PositionAggregator::Aggregate(run.settled_trades);
    EmitStructuredLog(&config_.log,
                      kApp,
                      "info",
                      "trades_settled",
                      {{"settled", std::to_string(run.settled_trades.size())},
                       {"tickers", std::to_string(run.positions.size())}});

    CoverNegativeBalances(inputs, rates, &run, &diagnostics);

    run.closed_positions =
        ClosedPositionResolver(config_.total_row_label).Resolve(run.settled_trades, run.positions);
    if (!Reconcile(inputs, &run, &diagnostics, error)) {
        return false;
    }

    run.diagnostics = diagnostics.entries();
    EmitStructuredLog(&config_.log,
                      kApp,
                      "info",
                      "reconciliation_completed",
                      {{"closed", std::to_string(run.closed_positions.size())},
                       {"insufficient", std::to_string(run.insufficient_data.size())},
                       {"borrowed", std::to_string(run.borrowed_trade_count)},
                       {"diagnostics", std::to_string(run.diagnostics.size())}});
    *result = std::move(run);
    return true;
}

bool ReconciliationPipeline::LoadPriorPeriodLots(const std::vector<RecordTable>& sources,
                                                 std::vector<Trade>* lots,
                                                 DiagnosticLog* diagnostics) const {
    ReconConfig prior_config = config_;
    prior_config.buy_keywords.insert(prior_config.buy_keywords.end(),
                                     config_.prior_lot_keywords.begin(),
                                     config_.prior_lot_keywords.end());
    const TradeNormalizer normalizer(prior_config);
    std::size_t accepted = 0;
    for (std::size_t index = 0; index < sources.size(); ++index) {
        const std::string source = "prior_period[" + std::to_string(index) + "]";
        std::vector<Trade> trades;
        std::string source_error;
        if (!normalizer.Normalize(sources[index],
                                  TradeOrigin::kPriorPeriod,
                                  source,
                                  &trades,
                                  diagnostics,
                                  &source_error)) {
            diagnostics->Record(ReconErrorCode::kPriorSourceRejected,
                                DiagnosticLevel::kError,
                                source,
                                "prior-period source rejected: " + source_error);
            continue;
        }
        ++accepted;
        for (auto& trade : trades) {
            if (trade.operation == OperationTag::kBuy) {
                lots->push_back(std::move(trade));
            }
        }
    }
    std::stable_sort(lots->begin(), lots->end(), [](const Trade& lhs, const Trade& rhs) {
        return lhs.trade_date < rhs.trade_date;
    });
    return accepted > 0;
}

void ReconciliationPipeline::CoverNegativeBalances(const ReconInputs& inputs,
                                                   const RateTable& rates,
                                                   ReconRunResult* result,
                                                   DiagnosticLog* diagnostics) const {
    const auto negative = PositionAggregator::NegativeTickers(result->positions);
    if (negative.empty()) {
        return;
    }

    if (inputs.prior_period_trades.empty()) {
        for (const auto& position : result->positions) {
            if (position.signed_balance >= 0) {
                continue;
            }
            diagnostics->Record(ReconErrorCode::kInsufficientPriorData,
                                DiagnosticLevel::kWarn,
                                "prior_period",
                                "negative balance " + std::to_string(position.signed_balance) +
                                    "; a prior-period trade report is needed to cover it",
                                position.ticker);
        }
        return;
    }

    std::vector<Trade> lots;
    if (!LoadPriorPeriodLots(inputs.prior_period_trades, &lots, diagnostics)) {
        EmitStructuredLog(&config_.log,
                          kApp,
                          "warn",
                          "prior_period_unavailable",
                          {{"sources", std::to_string(inputs.prior_period_trades.size())}});
    }

    const ShortCoverageResolver resolver(config_.borrowed_operation_label);
    CoverageResult coverage = resolver.Resolve(result->positions, lots, diagnostics);
    auto borrowed = SettlementCalculator::SettlePending(coverage.borrowed, rates, diagnostics);

    result->borrowed_trade_count = borrowed.size();
    result->coverage = std::move(coverage.outcomes);
    result->settled_trades.reserve(result->settled_trades.size() + borrowed.size());
    for (auto& item : borrowed) {
        result->settled_trades.push_back(std::move(item));
    }
    result->positions = PositionAggregator::Aggregate(result->settled_trades);

    EmitStructuredLog(&config_.log,
                      kApp,
                      "info",
                      "coverage_resolved",
                      {{"negative_tickers", std::to_string(negative.size())},
                       {"lots", std::to_string(lots.size())},
                       {"borrowed", std::to_string(result->borrowed_trade_count)}});
}

bool ReconciliationPipeline::Reconcile(const ReconInputs& inputs,
                                       ReconRunResult* result,
                                       DiagnosticLog* diagnostics,
                                       std::string* error) const {
    std::vector<DeclaredBalance> declared;
    if (inputs.declared_balances.has_value() &&
        !BuildDeclaredBalances(*inputs.declared_balances, &declared, diagnostics, error)) {
        return false;
    }
    result->balance_comparison = ReconciliationChecker::Compare(result->positions, declared);
    result->insufficient_data = ReconciliationChecker::Insufficient(result->balance_comparison);
    return true;
}

}  // namespace trade_recon
