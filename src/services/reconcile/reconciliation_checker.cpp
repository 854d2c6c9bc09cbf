#include "trade_recon/services/reconciliation_checker.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "trade_recon/core/record_table_view.h"

namespace trade_recon {

bool ReconciliationChecker::IsSufficient(std::int64_t computed_balance,
                                         const std::optional<std::int64_t>& declared_balance) {
    if (!declared_balance.has_value()) {
        return computed_balance == 0;
    }
    return computed_balance == *declared_balance;
}

std::vector<BalanceComparison> ReconciliationChecker::Compare(
    const std::vector<PositionSummary>& positions,
    const std::vector<DeclaredBalance>& declared) {
    std::map<std::string, BalanceComparison> joined;
    for (const auto& position : positions) {
        auto& row = joined[position.ticker];
        row.ticker = position.ticker;
        row.computed_balance = position.signed_balance;
    }
    for (const auto& balance : declared) {
        auto& row = joined[balance.ticker];
        row.ticker = balance.ticker;
        if (balance.end_balance.has_value()) {
            row.declared_balance = balance.end_balance;
        }
    }

    std::vector<BalanceComparison> comparison;
    comparison.reserve(joined.size());
    for (auto& entry : joined) {
        comparison.push_back(std::move(entry.second));
    }
    return comparison;
}

std::vector<BalanceComparison> ReconciliationChecker::Insufficient(
    const std::vector<BalanceComparison>& comparison) {
    std::vector<BalanceComparison> insufficient;
    for (const auto& row : comparison) {
        if (!row.computed_balance.has_value() ||
            !IsSufficient(*row.computed_balance, row.declared_balance)) {
            insufficient.push_back(row);
        }
    }
    return insufficient;
}

bool BuildDeclaredBalances(const RecordTable& records,
                           std::vector<DeclaredBalance>* out,
                           DiagnosticLog* diagnostics,
                           std::string* error) {
    if (out == nullptr || diagnostics == nullptr) {
        if (error != nullptr) {
            *error = "declared balance output pointer is null";
        }
        return false;
    }

    const RecordTableView view(records);
    const auto ticker_col = view.FindColumn({"ticker", "Тикер"});
    const auto balance_col = view.FindColumn({"end_balance", "declared_balance", "На конец"});
    if (!ticker_col.has_value() || !balance_col.has_value()) {
        if (error != nullptr) {
            *error = FormatFatal(ReconErrorCode::kSchema,
                                 std::string("declared balance table is missing the ") +
                                     (!ticker_col.has_value() ? "ticker" : "end_balance") +
                                     " column");
        }
        return false;
    }

    std::vector<DeclaredBalance> balances;
    balances.reserve(view.RowCount());
    for (std::size_t row = 0; row < view.RowCount(); ++row) {
        DeclaredBalance balance;
        balance.ticker = TrimCell(view.Cell(row, *ticker_col));
        if (balance.ticker.empty()) {
            diagnostics->Record(ReconErrorCode::kRowParse,
                                DiagnosticLevel::kWarn,
                                "declared_balances",
                                "skipped balance row: empty ticker",
                                "",
                                row);
            continue;
        }

        const std::string cell = view.Cell(row, *balance_col);
        if (!TrimCell(cell).empty()) {
            Decimal value;
            std::string row_error;
            std::int64_t parsed_balance = 0;
            if (!ParseDecimalCell(cell, &value, &row_error) || !value.IsInteger() ||
                !value.TryToInt64(&parsed_balance)) {
                if (row_error.empty()) {
                    row_error = value.IsInteger() ? "balance out of range: " + value.ToString()
                                                  : "balance is not integral: " + value.ToString();
                }
                diagnostics->Record(ReconErrorCode::kRowParse,
                                    DiagnosticLevel::kWarn,
                                    "declared_balances",
                                    "skipped balance row: " + row_error,
                                    balance.ticker,
                                    row);
                continue;
            }
            balance.end_balance = parsed_balance;
        }
        balances.push_back(std::move(balance));
    }

    *out = std::move(balances);
    return true;
}

}  // namespace trade_recon
