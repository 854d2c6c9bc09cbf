#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "trade_recon/common/timestamp.h"
#include "trade_recon/core/fixed_decimal.h"

namespace trade_recon {

enum class OperationTag {
    kBuy,
    kSell,
    kUnresolved,
};

enum class TradeOrigin {
    kCurrentPeriod,
    kPriorPeriod,
};

inline const char* OperationTagName(OperationTag tag) {
    switch (tag) {
        case OperationTag::kBuy:
            return "buy";
        case OperationTag::kSell:
            return "sell";
        case OperationTag::kUnresolved:
        default:
            return "unresolved";
    }
}

// Already-parsed tabular input: one header row plus string cells.
struct RecordTable {
    std::vector<std::string> columns;
    std::vector<std::vector<std::string>> rows;
};

struct RateEntry {
    Timestamp date;
    Decimal rate;
};

struct Trade {
    std::string ticker;
    OperationTag operation{OperationTag::kUnresolved};
    std::string operation_label;
    TradeOrigin origin{TradeOrigin::kCurrentPeriod};
    std::int64_t quantity{0};
    Decimal price;
    std::string trading_currency;
    Decimal amount;
    Decimal commission;
    std::string commission_currency;
    Timestamp trade_date;
    Timestamp settlement_date;
    std::optional<Decimal> applied_rate;
    // Position of the row in its source table, for diagnostics.
    std::size_t source_row{0};
};

struct SettledTrade {
    Trade trade;
    Decimal rub_amount;
    Decimal rub_commission;
    Decimal net_result;
    bool rate_fallback{false};
};

struct PositionSummary {
    std::string ticker;
    std::int64_t signed_balance{0};
    Decimal realized_result;
};

struct ClosedPosition {
    std::string ticker;
    Decimal total_buys;
    Decimal total_sells;
    Decimal total_commission;
    Decimal net_result;
    bool is_total{false};
};

struct DeclaredBalance {
    std::string ticker;
    std::optional<std::int64_t> end_balance;
};

struct BalanceComparison {
    std::string ticker;
    std::optional<std::int64_t> computed_balance;
    std::optional<std::int64_t> declared_balance;
};

struct CoverageOutcome {
    std::string ticker;
    std::int64_t shortfall{0};
    std::int64_t consumed{0};
    std::int64_t residual{0};
    std::int32_t lots_used{0};
};

// +quantity for Buy; every other operation reduces the balance.
inline std::int64_t SignedQuantity(const Trade& trade) {
    return trade.operation == OperationTag::kBuy ? trade.quantity : -trade.quantity;
}

}  // namespace trade_recon
