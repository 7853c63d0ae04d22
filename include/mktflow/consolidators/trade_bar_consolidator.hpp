// include/mktflow/consolidators/trade_bar_consolidator.hpp
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include "mktflow/consolidators/data_consolidator_base.hpp"

namespace mktflow {

/**
 * @brief Rolls smaller trade bars up into bars of a longer fixed period
 *
 * Incoming bars are bucketed by their start time. The working bar is emitted
 * when a bar starting at or after its end time arrives.
 */
class TradeBarConsolidator : public DataConsolidatorBase<TradeBar, TradeBar> {
public:
    /**
     * @param period Output bar length, must be positive
     * @throws FlowError if period is not positive
     */
    explicit TradeBarConsolidator(std::chrono::system_clock::duration period);

    std::chrono::system_clock::duration period() const {
        return period_;
    }

    const std::optional<TradeBar>& working_bar() const {
        return working_bar_;
    }

protected:
    std::string name() const override {
        return "TradeBarConsolidator";
    }

    void update_typed(const TradeBar& bar) override;

private:
    std::chrono::system_clock::duration period_;
    std::optional<TradeBar> working_bar_;
};

}  // namespace mktflow
