#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "trade_recon/services/position_aggregator.h"
#include "trade_recon/services/short_coverage_resolver.h"

namespace trade_recon {
namespace {

Decimal D(const std::string& text) {
    Decimal value;
    std::string error;
    EXPECT_TRUE(Decimal::Parse(text, &value, &error)) << error;
    return value;
}

Trade Lot(const std::string& ticker,
          OperationTag operation,
          std::int64_t quantity,
          const std::string& amount,
          const std::string& commission,
          const std::string& date) {
    Trade trade;
    trade.ticker = ticker;
    trade.operation = operation;
    trade.operation_label = operation == OperationTag::kBuy ? "Покупка" : "Продажа";
    trade.origin = TradeOrigin::kPriorPeriod;
    trade.quantity = quantity;
    trade.price = D("100");
    trade.trading_currency = "USD";
    trade.amount = D(amount);
    trade.commission = D(commission);
    trade.trade_date = Timestamp::FromText(date);
    trade.settlement_date = Timestamp::FromText(date);
    return trade;
}

PositionSummary Position(const std::string& ticker, std::int64_t balance) {
    PositionSummary position;
    position.ticker = ticker;
    position.signed_balance = balance;
    return position;
}

}  // namespace

TEST(ShortCoverageResolverTest, ConsumesMostRecentLotFirstAndSplitsTheNext) {
    const std::vector<Trade> lots = {
        Lot("ABC", OperationTag::kBuy, 10, "1000.00", "5.00", "2023-03-01"),
        Lot("ABC", OperationTag::kBuy, 8, "880.00", "4.00", "2023-06-01"),
    };
    DiagnosticLog diagnostics;
    const auto result =
        ShortCoverageResolver().Resolve({Position("ABC", -15)}, lots, &diagnostics);

    ASSERT_EQ(result.borrowed.size(), 2U);
    EXPECT_EQ(result.borrowed[0].quantity, 8);
    EXPECT_EQ(result.borrowed[0].trade_date.ToDate(), "2023-06-01");
    EXPECT_EQ(result.borrowed[0].amount, D("880.00"));
    EXPECT_EQ(result.borrowed[0].commission, D("4.00"));
    EXPECT_EQ(result.borrowed[1].quantity, 7);
    EXPECT_EQ(result.borrowed[1].trade_date.ToDate(), "2023-03-01");
    EXPECT_EQ(result.borrowed[1].amount, D("700.00"));
    EXPECT_EQ(result.borrowed[1].commission, D("3.50"));
    for (const auto& trade : result.borrowed) {
        EXPECT_EQ(trade.operation, OperationTag::kBuy);
        EXPECT_EQ(trade.operation_label, "Buy (prior period)");
        EXPECT_EQ(trade.origin, TradeOrigin::kPriorPeriod);
        EXPECT_FALSE(trade.applied_rate.has_value());
    }

    ASSERT_EQ(result.outcomes.size(), 1U);
    EXPECT_EQ(result.outcomes[0].shortfall, 15);
    EXPECT_EQ(result.outcomes[0].consumed, 15);
    EXPECT_EQ(result.outcomes[0].residual, 0);
    EXPECT_EQ(result.outcomes[0].lots_used, 2);
    EXPECT_FALSE(diagnostics.Has(ReconErrorCode::kInsufficientPriorData));

    std::vector<SettledTrade> extended(1);
    extended[0].trade = Lot("ABC", OperationTag::kSell, 15, "1500.00", "0", "2024-02-01");
    for (const auto& trade : result.borrowed) {
        SettledTrade settled;
        settled.trade = trade;
        extended.push_back(settled);
    }
    EXPECT_EQ(PositionAggregator::Aggregate(extended)[0].signed_balance, 0);
}

TEST(ShortCoverageResolverTest, ReportsResidualWhenLotsRunOut) {
    const std::vector<Trade> lots = {
        Lot("ABC", OperationTag::kBuy, 10, "1000.00", "5.00", "2023-03-01"),
        Lot("ABC", OperationTag::kBuy, 8, "880.00", "4.00", "2023-06-01"),
    };
    DiagnosticLog diagnostics;
    const auto result =
        ShortCoverageResolver().Resolve({Position("ABC", -20)}, lots, &diagnostics);

    ASSERT_EQ(result.outcomes.size(), 1U);
    EXPECT_EQ(result.outcomes[0].consumed, 18);
    EXPECT_EQ(result.outcomes[0].residual, 2);
    EXPECT_EQ(result.outcomes[0].residual,
              result.outcomes[0].shortfall - result.outcomes[0].consumed);
    std::int64_t borrowed_quantity = 0;
    for (const auto& trade : result.borrowed) {
        borrowed_quantity += trade.quantity;
    }
    EXPECT_EQ(borrowed_quantity, 18);
    EXPECT_EQ(diagnostics.Count(ReconErrorCode::kInsufficientPriorData), 1U);
}

TEST(ShortCoverageResolverTest, UsesOnlyBuyLotsOfTheSameTicker) {
    const std::vector<Trade> lots = {
        Lot("ABC", OperationTag::kSell, 50, "5000.00", "0", "2023-09-01"),
        Lot("XYZ", OperationTag::kBuy, 50, "5000.00", "0", "2023-09-01"),
        Lot("ABC", OperationTag::kBuy, 0, "0", "0", "2023-08-01"),
        Lot("ABC", OperationTag::kBuy, 3, "100.00", "1.00", "2023-07-01"),
    };
    DiagnosticLog diagnostics;
    const auto result = ShortCoverageResolver("Carried lot")
                            .Resolve({Position("ABC", -1), Position("XYZ", 4)}, lots, &diagnostics);

    ASSERT_EQ(result.borrowed.size(), 1U);
    EXPECT_EQ(result.borrowed[0].ticker, "ABC");
    EXPECT_EQ(result.borrowed[0].operation_label, "Carried lot");
    EXPECT_EQ(result.borrowed[0].amount, D("33.33"));
    EXPECT_EQ(result.borrowed[0].commission, D("0.33"));
    ASSERT_EQ(result.outcomes.size(), 1U);
    EXPECT_EQ(result.outcomes[0].lots_used, 1);
    EXPECT_EQ(diagnostics.Count(ReconErrorCode::kRowParse), 1U);
}

TEST(ShortCoverageResolverTest, NoNegativeBalancesIsNoop) {
    const std::vector<Trade> lots = {
        Lot("ABC", OperationTag::kBuy, 10, "1000.00", "5.00", "2023-03-01"),
    };
    const auto result = ShortCoverageResolver().Resolve(
        {Position("ABC", 0), Position("XYZ", 7)}, lots, nullptr);
    EXPECT_TRUE(result.borrowed.empty());
    EXPECT_TRUE(result.outcomes.empty());
}

TEST(ShortCoverageResolverTest, CollectLotsOrdersByTradeDateDescending) {
    const std::vector<Trade> lots = {
        Lot("ABC", OperationTag::kBuy, 1, "1", "0", "2023-01-01"),
        Lot("ABC", OperationTag::kBuy, 2, "2", "0", "2023-05-01"),
        Lot("ABC", OperationTag::kBuy, 3, "3", "0", "2023-03-01"),
    };
    const auto ordered = ShortCoverageResolver::CollectLots("ABC", lots);
    ASSERT_EQ(ordered.size(), 3U);
    EXPECT_EQ(ordered[0]->quantity, 2);
    EXPECT_EQ(ordered[1]->quantity, 3);
    EXPECT_EQ(ordered[2]->quantity, 1);
}

}  // namespace trade_recon
