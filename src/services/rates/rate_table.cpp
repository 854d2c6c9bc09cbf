#include "trade_recon/services/rate_table.h"

#include <algorithm>
#include <iterator>
#include <numeric>
#include <string>
#include <utility>
#include <vector>

#include "trade_recon/core/record_table_view.h"

namespace trade_recon {

RateTable::RateTable(std::vector<RateEntry> entries) {
    std::stable_sort(entries.begin(), entries.end(), [](const RateEntry& lhs, const RateEntry& rhs) {
        return lhs.date < rhs.date;
    });
    entries_.reserve(entries.size());
    for (auto& entry : entries) {
        if (!entries_.empty() && entries_.back().date == entry.date) {
            entries_.back() = std::move(entry);
            continue;
        }
        entries_.push_back(std::move(entry));
    }
}

std::optional<Decimal> RateTable::Lookup(const Timestamp& as_of) const {
    const auto it = std::upper_bound(
        entries_.begin(), entries_.end(), as_of, [](const Timestamp& value, const RateEntry& entry) {
            return value < entry.date;
        });
    if (it == entries_.begin()) {
        return std::nullopt;
    }
    return std::prev(it)->rate;
}

std::vector<std::optional<Decimal>> RateTable::ResolveAsOf(const std::vector<Trade>& trades) const {
    std::vector<std::optional<Decimal>> resolved(trades.size());
    std::vector<std::size_t> order(trades.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&trades](std::size_t lhs, std::size_t rhs) {
        return trades[lhs].settlement_date < trades[rhs].settlement_date;
    });

    std::size_t cursor = 0;
    const RateEntry* current = nullptr;
    for (const std::size_t index : order) {
        const Timestamp& as_of = trades[index].settlement_date;
        while (cursor < entries_.size() && entries_[cursor].date <= as_of) {
            current = &entries_[cursor];
            ++cursor;
        }
        if (current != nullptr) {
            resolved[index] = current->rate;
        }
    }
    return resolved;
}

bool BuildRateTable(const RecordTable& records,
                    const ReconConfig& config,
                    RateTable* out,
                    DiagnosticLog* diagnostics,
                    std::string* error) {
    if (out == nullptr || diagnostics == nullptr) {
        if (error != nullptr) {
            *error = "rate table output pointer is null";
        }
        return false;
    }

    const RecordTableView view(records);
    const auto date_col = view.FindColumn({"date", "data"});
    const auto rate_col = view.FindColumn({"rate", "curs"});
    if (!date_col.has_value() || !rate_col.has_value()) {
        if (error != nullptr) {
            *error = FormatFatal(ReconErrorCode::kSchema,
                                 std::string("rate table is missing the ") +
                                     (!date_col.has_value() ? "date" : "rate") + " column");
        }
        return false;
    }
    const auto currency_col = view.FindColumn({"currency", "cdx"});
    const bool filter_currency = !config.rate_currency_label.empty() && currency_col.has_value();

    std::vector<RateEntry> entries;
    entries.reserve(view.RowCount());
    std::size_t filtered = 0;
    for (std::size_t row = 0; row < view.RowCount(); ++row) {
        if (filter_currency && TrimCell(view.Cell(row, *currency_col)) != config.rate_currency_label) {
            ++filtered;
            continue;
        }

        RateEntry entry;
        std::string row_error;
        if (!ParseTimestampCell(view.Cell(row, *date_col), &entry.date, &row_error) ||
            !ParseDecimalCell(view.Cell(row, *rate_col), &entry.rate, &row_error)) {
            diagnostics->Record(ReconErrorCode::kRowParse,
                                DiagnosticLevel::kWarn,
                                "rates",
                                "skipped rate row: " + row_error,
                                "",
                                row);
            continue;
        }
        if (entry.rate <= Decimal()) {
            diagnostics->Record(ReconErrorCode::kRowParse,
                                DiagnosticLevel::kWarn,
                                "rates",
                                "skipped rate row: rate must be positive, got " +
                                    entry.rate.ToString(),
                                "",
                                row);
            continue;
        }
        entries.push_back(std::move(entry));
    }

    if (filtered > 0) {
        diagnostics->Record(ReconErrorCode::kCurrencyFiltered,
                            DiagnosticLevel::kInfo,
                            "rates",
                            std::to_string(filtered) + " rate rows not labelled '" +
                                config.rate_currency_label + "' were dropped");
    }

    *out = RateTable(std::move(entries));
    return true;
}

}  // namespace trade_recon
