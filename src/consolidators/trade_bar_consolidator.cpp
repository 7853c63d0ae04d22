// src/consolidators/trade_bar_consolidator.cpp
#include "mktflow/consolidators/trade_bar_consolidator.hpp"
#include <algorithm>
#include "mktflow/core/time_utils.hpp"

namespace mktflow {

TradeBarConsolidator::TradeBarConsolidator(std::chrono::system_clock::duration period)
    : period_(period) {
    if (period_ <= std::chrono::system_clock::duration::zero()) {
        throw FlowError(ErrorCode::INVALID_ARGUMENT, "Consolidation period must be positive",
                        "TradeBarConsolidator");
    }
}

void TradeBarConsolidator::update_typed(const TradeBar& bar) {
    if (working_bar_ && bar.timestamp >= working_bar_->end_time) {
        TradeBar completed = std::move(*working_bar_);
        working_bar_.reset();
        on_data_consolidated(completed);
    }

    if (!working_bar_) {
        Timestamp start = core::floor_to(bar.timestamp, period_);
        working_bar_.emplace(start, start + period_, bar.symbol, bar.open, bar.high, bar.low,
                             bar.close, bar.volume);
        return;
    }

    working_bar_->high = std::max(working_bar_->high, bar.high);
    working_bar_->low = std::min(working_bar_->low, bar.low);
    working_bar_->close = bar.close;
    working_bar_->volume += bar.volume;
}

}  // namespace mktflow
