// include/mktflow/consolidators/tick_consolidator.hpp
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include "mktflow/consolidators/data_consolidator_base.hpp"

namespace mktflow {

/**
 * @brief Aggregates ticks into fixed-period trade bars
 *
 * Bars are aligned to multiples of the period. The working bar is emitted
 * when the first tick at or after its end time arrives; a tick never closes
 * a bar on its own timestamp alone.
 */
class TickConsolidator : public DataConsolidatorBase<Tick, TradeBar> {
public:
    /**
     * @param period Bar length, must be positive
     * @throws FlowError if period is not positive
     */
    explicit TickConsolidator(std::chrono::system_clock::duration period);

    std::chrono::system_clock::duration period() const {
        return period_;
    }

    /**
     * @brief Bar currently being built, empty before the first tick
     */
    const std::optional<TradeBar>& working_bar() const {
        return working_bar_;
    }

protected:
    std::string name() const override {
        return "TickConsolidator";
    }

    void update_typed(const Tick& tick) override;

private:
    std::chrono::system_clock::duration period_;
    std::optional<TradeBar> working_bar_;
};

}  // namespace mktflow
