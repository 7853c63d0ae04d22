// src/consolidators/tick_consolidator.cpp
#include "mktflow/consolidators/tick_consolidator.hpp"
#include <algorithm>
#include "mktflow/core/time_utils.hpp"

namespace mktflow {

TickConsolidator::TickConsolidator(std::chrono::system_clock::duration period)
    : period_(period) {
    if (period_ <= std::chrono::system_clock::duration::zero()) {
        throw FlowError(ErrorCode::INVALID_ARGUMENT, "Consolidation period must be positive",
                        "TickConsolidator");
    }
}

void TickConsolidator::update_typed(const Tick& tick) {
    if (working_bar_ && tick.timestamp >= working_bar_->end_time) {
        TradeBar completed = std::move(*working_bar_);
        working_bar_.reset();
        on_data_consolidated(completed);
    }

    if (!working_bar_) {
        Timestamp start = core::floor_to(tick.timestamp, period_);
        working_bar_.emplace(start, start + period_, tick.symbol, tick.price, tick.price,
                             tick.price, tick.price, tick.quantity);
        return;
    }

    working_bar_->high = std::max(working_bar_->high, tick.price);
    working_bar_->low = std::min(working_bar_->low, tick.price);
    working_bar_->close = tick.price;
    working_bar_->volume += tick.quantity;
}

}  // namespace mktflow
