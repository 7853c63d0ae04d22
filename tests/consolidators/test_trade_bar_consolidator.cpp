#include <gtest/gtest.h>
#include <vector>
#include "../core/test_base.hpp"
#include "mktflow/consolidators/trade_bar_consolidator.hpp"
#include "mktflow/core/time_utils.hpp"

using namespace mktflow;
using namespace mktflow::testing;

class TradeBarConsolidatorTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        start_ = core::make_timestamp(2024, 3, 4, 14, 0, 0);
    }

    TradeBar minute_bar(int minute, Price open, Price high, Price low, Price close,
                        Quantity volume) const {
        Timestamp ts = start_ + std::chrono::minutes(minute);
        return TradeBar(ts, ts + std::chrono::minutes(1), "AAPL", open, high, low, close, volume);
    }

    Timestamp start_;
};

TEST_F(TradeBarConsolidatorTest, RollsMinutesIntoFiveMinuteBar) {
    TradeBarConsolidator consolidator(std::chrono::minutes(5));
    std::vector<TradeBar> bars;
    ASSERT_TRUE(consolidator
                    .subscribe([&bars](const DataConsolidator&, const MarketData& data) {
                        bars.push_back(std::get<TradeBar>(data));
                    })
                    .is_ok());

    consolidator.update(minute_bar(0, 10.0, 11.0, 9.5, 10.5, 100));
    consolidator.update(minute_bar(1, 10.5, 12.0, 10.0, 11.0, 200));
    consolidator.update(minute_bar(2, 11.0, 11.5, 9.0, 9.25, 300));
    consolidator.update(minute_bar(3, 9.25, 10.0, 9.1, 9.75, 50));
    consolidator.update(minute_bar(4, 9.75, 10.25, 9.5, 10.0, 50));
    EXPECT_TRUE(bars.empty());

    consolidator.update(minute_bar(5, 10.0, 10.0, 10.0, 10.0, 1));

    ASSERT_EQ(bars.size(), 1u);
    EXPECT_EQ(bars[0].timestamp, start_);
    EXPECT_EQ(bars[0].end_time, start_ + std::chrono::minutes(5));
    EXPECT_EQ(bars[0].period(), std::chrono::minutes(5));
    EXPECT_DOUBLE_EQ(bars[0].open, 10.0);
    EXPECT_DOUBLE_EQ(bars[0].high, 12.0);
    EXPECT_DOUBLE_EQ(bars[0].low, 9.0);
    EXPECT_DOUBLE_EQ(bars[0].close, 10.0);
    EXPECT_DOUBLE_EQ(bars[0].volume, 700.0);
}

TEST_F(TradeBarConsolidatorTest, DeclaresTypes) {
    TradeBarConsolidator consolidator(std::chrono::hours(1));
    EXPECT_EQ(consolidator.input_type(), DataType::TRADE_BAR);
    EXPECT_EQ(consolidator.output_type(), DataType::TRADE_BAR);
}

TEST_F(TradeBarConsolidatorTest, RejectsTicks) {
    TradeBarConsolidator consolidator(std::chrono::minutes(5));
    EXPECT_THROW(consolidator.update(Tick(start_, "AAPL", 1.0, 1.0)), FlowError);
    EXPECT_FALSE(consolidator.consolidated().has_value());
}

TEST_F(TradeBarConsolidatorTest, MidPeriodStartAlignsDown) {
    TradeBarConsolidator consolidator(std::chrono::minutes(5));
    consolidator.update(minute_bar(3, 1.0, 1.0, 1.0, 1.0, 1));

    ASSERT_TRUE(consolidator.working_bar().has_value());
    EXPECT_EQ(consolidator.working_bar()->timestamp, start_);
    EXPECT_EQ(consolidator.working_bar()->end_time, start_ + std::chrono::minutes(5));
}
