#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "trade_recon/services/closed_position_resolver.h"
#include "trade_recon/services/position_aggregator.h"

namespace trade_recon {
namespace {

Decimal D(const std::string& text) {
    Decimal value;
    std::string error;
    EXPECT_TRUE(Decimal::Parse(text, &value, &error)) << error;
    return value;
}

SettledTrade Settled(const std::string& ticker,
                     OperationTag operation,
                     std::int64_t quantity,
                     const std::string& rub_amount,
                     const std::string& rub_commission) {
    SettledTrade settled;
    settled.trade.ticker = ticker;
    settled.trade.operation = operation;
    settled.trade.quantity = quantity;
    settled.rub_amount = D(rub_amount);
    settled.rub_commission = D(rub_commission);
    settled.net_result = Round2(settled.rub_amount - settled.rub_commission);
    return settled;
}

}  // namespace

TEST(ClosedPositionResolverTest, ClosedTickerBreakdown) {
    const std::vector<SettledTrade> settled = {
        Settled("XYZ", OperationTag::kBuy, 10, "-1000.00", "10.00"),
        Settled("XYZ", OperationTag::kSell, 10, "1200.00", "10.00"),
    };
    const auto positions = PositionAggregator::Aggregate(settled);
    ASSERT_EQ(positions[0].signed_balance, 0);

    const auto closed = ClosedPositionResolver().Resolve(settled, positions);
    ASSERT_EQ(closed.size(), 2U);
    EXPECT_EQ(closed[0].ticker, "XYZ");
    EXPECT_FALSE(closed[0].is_total);
    EXPECT_EQ(closed[0].total_buys.ToString(2), "1000.00");
    EXPECT_EQ(closed[0].total_sells.ToString(2), "1200.00");
    EXPECT_EQ(closed[0].total_commission.ToString(2), "20.00");
    EXPECT_EQ(closed[0].net_result.ToString(2), "180.00");
    EXPECT_TRUE(closed[1].is_total);
    EXPECT_EQ(closed[1].ticker, "Total");
}

TEST(ClosedPositionResolverTest, OpenTickersAreExcludedAndTotalSumsRows) {
    const std::vector<SettledTrade> settled = {
        Settled("AAA", OperationTag::kBuy, 3, "-300.33", "1.11"),
        Settled("AAA", OperationTag::kSell, 3, "350.55", "1.12"),
        Settled("BBB", OperationTag::kBuy, 5, "-500.00", "2.00"),
        Settled("CCC", OperationTag::kSell, 2, "220.00", "0.50"),
        Settled("CCC", OperationTag::kBuy, 2, "-199.99", "0.49"),
    };
    const auto positions = PositionAggregator::Aggregate(settled);
    const auto closed = ClosedPositionResolver("Итого").Resolve(settled, positions);

    ASSERT_EQ(closed.size(), 3U);
    EXPECT_EQ(closed[0].ticker, "AAA");
    EXPECT_EQ(closed[1].ticker, "CCC");
    for (const auto& row : closed) {
        EXPECT_NE(row.ticker, "BBB");
    }
    EXPECT_EQ(closed[0].net_result, D("47.99"));
    EXPECT_EQ(closed[1].net_result, D("19.02"));

    const auto& total = closed.back();
    EXPECT_TRUE(total.is_total);
    EXPECT_EQ(total.ticker, "Итого");
    Decimal buys;
    Decimal sells;
    Decimal commission;
    Decimal net;
    for (std::size_t i = 0; i + 1 < closed.size(); ++i) {
        buys += closed[i].total_buys;
        sells += closed[i].total_sells;
        commission += closed[i].total_commission;
        net += closed[i].net_result;
    }
    EXPECT_EQ(total.total_buys, Round2(buys));
    EXPECT_EQ(total.total_sells, Round2(sells));
    EXPECT_EQ(total.total_commission, Round2(commission));
    EXPECT_EQ(total.net_result, Round2(net));
    EXPECT_EQ(total.net_result,
              Round2(total.total_sells - total.total_buys - total.total_commission));
}

TEST(ClosedPositionResolverTest, NoClosedTickersMeansNoRows) {
    const std::vector<SettledTrade> settled = {
        Settled("BBB", OperationTag::kBuy, 5, "-500.00", "2.00"),
    };
    const auto positions = PositionAggregator::Aggregate(settled);
    EXPECT_TRUE(ClosedPositionResolver().Resolve(settled, positions).empty());
}

}  // namespace trade_recon
