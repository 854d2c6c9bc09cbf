#include "trade_recon/services/trade_normalizer.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "trade_recon/core/record_table_view.h"

namespace trade_recon {
namespace {

struct TradeColumns {
    std::optional<std::size_t> ticker;
    std::optional<std::size_t> operation;
    std::optional<std::size_t> quantity;
    std::optional<std::size_t> price;
    std::optional<std::size_t> currency;
    std::optional<std::size_t> amount;
    std::optional<std::size_t> commission;
    std::optional<std::size_t> commission_currency;
    std::optional<std::size_t> trade_date;
    std::optional<std::size_t> settlement_date;
};

TradeColumns ResolveColumns(const RecordTableView& view) {
    TradeColumns columns;
    columns.ticker = view.FindColumn({"ticker", "Тикер"});
    columns.operation = view.FindColumn({"operation", "Операция"});
    columns.quantity = view.FindColumn({"quantity", "Количество"});
    columns.price = view.FindColumn({"price", "Цена"});
    columns.currency = view.FindColumn({"currency", "Валюта"});
    columns.amount = view.FindColumn({"amount", "Сумма"});
    columns.commission = view.FindColumn({"commission", "Комиссия"});
    columns.commission_currency =
        view.FindColumn({"commission_currency", "Валюта комиссии"});
    columns.trade_date = view.FindColumn({"trade_date", "Дата сделки"});
    columns.settlement_date = view.FindColumn({"settlement_date", "Расчеты"});
    return columns;
}

void ReportMissingColumns(const TradeColumns& columns,
                          const ReconConfig& config,
                          const std::string& source,
                          DiagnosticLog* diagnostics) {
    const std::pair<const std::optional<std::size_t>*, std::string> optional_columns[] = {
        {&columns.quantity, "quantity (defaulted to 0)"},
        {&columns.price, "price (defaulted to 0)"},
        {&columns.amount, "amount (defaulted to 0)"},
        {&columns.commission, "commission (defaulted to 0)"},
        {&columns.currency, "currency (defaulted to " + config.trading_currency + ")"},
        {&columns.commission_currency,
         "commission_currency (defaulted to " + config.trading_currency + ")"},
        {&columns.trade_date, "trade_date (defaulted to current time)"},
        {&columns.settlement_date, "settlement_date (defaulted to current time)"},
    };
    for (const auto& [column, description] : optional_columns) {
        if (!column->has_value()) {
            diagnostics->Record(ReconErrorCode::kMissingColumn,
                                DiagnosticLevel::kWarn,
                                source,
                                "missing column " + description);
        }
    }
}

}  // namespace

OperationClassifier::OperationClassifier(const std::vector<std::string>& buy_keywords,
                                         const std::vector<std::string>& sell_keywords) {
    for (const auto& keyword : buy_keywords) {
        if (!keyword.empty()) {
            buy_keywords_.push_back(FoldCase(keyword));
        }
    }
    for (const auto& keyword : sell_keywords) {
        if (!keyword.empty()) {
            sell_keywords_.push_back(FoldCase(keyword));
        }
    }
}

OperationTag OperationClassifier::Classify(const std::string& raw_label) const {
    const std::string folded = FoldCase(TrimCell(raw_label));
    if (ContainsAny(folded, buy_keywords_)) {
        return OperationTag::kBuy;
    }
    if (ContainsAny(folded, sell_keywords_)) {
        return OperationTag::kSell;
    }
    return OperationTag::kUnresolved;
}

std::string OperationClassifier::FoldCase(const std::string& text) {
    std::string folded;
    folded.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto ch = static_cast<unsigned char>(text[i]);
        if (ch >= 'A' && ch <= 'Z') {
            folded.push_back(static_cast<char>(ch - 'A' + 'a'));
            continue;
        }
        if (ch == 0xD0 && i + 1 < text.size()) {
            const auto next = static_cast<unsigned char>(text[i + 1]);
            if (next >= 0x90 && next <= 0x9F) {
                // А..П -> а..п
                folded.push_back(static_cast<char>(0xD0));
                folded.push_back(static_cast<char>(next + 0x20));
                ++i;
                continue;
            }
            if (next >= 0xA0 && next <= 0xAF) {
                // Р..Я -> р..я
                folded.push_back(static_cast<char>(0xD1));
                folded.push_back(static_cast<char>(next - 0x20));
                ++i;
                continue;
            }
            if (next >= 0x80 && next <= 0x8F) {
                // Ѐ..Џ (Ё included) -> ѐ..џ
                folded.push_back(static_cast<char>(0xD1));
                folded.push_back(static_cast<char>(next + 0x10));
                ++i;
                continue;
            }
        }
        folded.push_back(static_cast<char>(ch));
    }
    return folded;
}

bool OperationClassifier::ContainsAny(const std::string& folded,
                                      const std::vector<std::string>& keywords) {
    for (const auto& keyword : keywords) {
        if (folded.find(keyword) != std::string::npos) {
            return true;
        }
    }
    return false;
}

TradeNormalizer::TradeNormalizer(ReconConfig config)
    : config_(std::move(config)), classifier_(config_.buy_keywords, config_.sell_keywords) {}

OperationTag TradeNormalizer::NormalizeOperation(const std::string& raw_label) const {
    return classifier_.Classify(raw_label);
}

bool TradeNormalizer::Normalize(const RecordTable& records,
                                TradeOrigin origin,
                                const std::string& source,
                                std::vector<Trade>* out,
                                DiagnosticLog* diagnostics,
                                std::string* error) const {
    if (out == nullptr || diagnostics == nullptr) {
        if (error != nullptr) {
            *error = "normalizer output pointer is null";
        }
        return false;
    }

    const RecordTableView view(records);
    const TradeColumns columns = ResolveColumns(view);
    if (!columns.ticker.has_value() || !columns.operation.has_value()) {
        if (error != nullptr) {
            *error = FormatFatal(ReconErrorCode::kSchema,
                                 source + " table is missing the " +
                                     (!columns.ticker.has_value() ? "ticker" : "operation") +
                                     " column");
        }
        return false;
    }
    ReportMissingColumns(columns, config_, source, diagnostics);

    const Timestamp now = Timestamp::Now();
    std::vector<Trade> trades;
    trades.reserve(view.RowCount());
    std::size_t filtered = 0;

    for (std::size_t row = 0; row < view.RowCount(); ++row) {
        const std::string currency =
            columns.currency.has_value() ? TrimCell(view.Cell(row, *columns.currency))
                                         : config_.trading_currency;
        if (config_.filter_by_currency && currency != config_.trading_currency) {
            ++filtered;
            continue;
        }

        Trade trade;
        trade.origin = origin;
        trade.source_row = row;
        trade.trading_currency = currency;
        trade.ticker = TrimCell(view.Cell(row, *columns.ticker));
        trade.operation_label = TrimCell(view.Cell(row, *columns.operation));

        std::string row_error;
        auto reject = [&](const std::string& field) {
            diagnostics->Record(ReconErrorCode::kRowParse,
                                DiagnosticLevel::kWarn,
                                source,
                                "skipped trade row: " + field + ": " + row_error,
                                trade.ticker,
                                row);
        };
        auto parse_decimal = [&](const std::optional<std::size_t>& column,
                                 bool empty_is_zero,
                                 Decimal* value) {
            if (!column.has_value()) {
                *value = Decimal();
                return true;
            }
            const std::string cell = view.Cell(row, *column);
            if (empty_is_zero && TrimCell(cell).empty()) {
                *value = Decimal();
                return true;
            }
            return ParseDecimalCell(cell, value, &row_error);
        };
        auto parse_date = [&](const std::optional<std::size_t>& column, Timestamp* value) {
            if (!column.has_value()) {
                *value = now;
                return true;
            }
            return ParseTimestampCell(view.Cell(row, *column), value, &row_error);
        };

        if (trade.ticker.empty()) {
            row_error = "empty ticker";
            reject("ticker");
            continue;
        }

        Decimal quantity;
        if (!parse_decimal(columns.quantity, false, &quantity)) {
            reject("quantity");
            continue;
        }
        if (!quantity.IsInteger()) {
            row_error = "quantity is not integral: " + quantity.ToString();
            reject("quantity");
            continue;
        }
        if (!quantity.Abs().TryToInt64(&trade.quantity)) {
            row_error = "quantity out of range: " + quantity.ToString();
            reject("quantity");
            continue;
        }

        if (!parse_decimal(columns.price, false, &trade.price)) {
            reject("price");
            continue;
        }
        if (!parse_decimal(columns.amount, false, &trade.amount)) {
            reject("amount");
            continue;
        }
        trade.amount = trade.amount.Abs();
        if (!parse_decimal(columns.commission, true, &trade.commission)) {
            reject("commission");
            continue;
        }
        trade.commission = trade.commission.Abs();
        if (!parse_date(columns.trade_date, &trade.trade_date)) {
            reject("trade_date");
            continue;
        }
        if (!parse_date(columns.settlement_date, &trade.settlement_date)) {
            reject("settlement_date");
            continue;
        }

        trade.commission_currency =
            columns.commission_currency.has_value()
                ? TrimCell(view.Cell(row, *columns.commission_currency))
                : std::string();
        if (trade.commission_currency.empty()) {
            trade.commission_currency = config_.trading_currency;
        }

        trade.operation = classifier_.Classify(trade.operation_label);
        if (trade.operation == OperationTag::kUnresolved) {
            diagnostics->Record(ReconErrorCode::kUnresolvedOperation,
                                DiagnosticLevel::kWarn,
                                source,
                                "operation '" + trade.operation_label +
                                    "' matches no buy/sell keyword; its quantity reduces "
                                    "the balance",
                                trade.ticker,
                                row);
        }
        trades.push_back(std::move(trade));
    }

    if (filtered > 0) {
        diagnostics->Record(ReconErrorCode::kCurrencyFiltered,
                            DiagnosticLevel::kInfo,
                            source,
                            std::to_string(filtered) + " rows not in " +
                                config_.trading_currency + " were dropped");
    }

    *out = std::move(trades);
    return true;
}

}  // namespace trade_recon
