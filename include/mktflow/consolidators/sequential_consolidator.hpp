// include/mktflow/consolidators/sequential_consolidator.hpp
#pragma once

#include <memory>
#include <optional>
#include "mktflow/consolidators/data_consolidator.hpp"
#include "mktflow/core/error.hpp"

namespace mktflow {

/**
 * @brief Chains two consolidators so the output of the first feeds the second
 *
 * The chain accepts what first accepts, produces what second produces and
 * re-fires second's notifications as its own. Because it satisfies the
 * DataConsolidator contract itself, pipelines of any length can be built as
 * nested pairs: SequentialConsolidator(a, SequentialConsolidator(b, c)).
 *
 * Type compatibility is checked once when the chain is wired; update() does
 * no validation of its own.
 */
class SequentialConsolidator : public DataConsolidator {
public:
    /**
     * @brief Wire first's output into second's input
     * @param first Consolidator receiving the chain's input
     * @param second Consolidator receiving first's output
     * @throws FlowError with TYPE_MISMATCH if first->output_type() differs from
     *         second->input_type(), INVALID_ARGUMENT if either is null or both
     *         are the same instance. Nothing is subscribed when construction
     *         fails.
     */
    SequentialConsolidator(std::shared_ptr<DataConsolidator> first,
                           std::shared_ptr<DataConsolidator> second);

    ~SequentialConsolidator() override;

    /**
     * @brief Non-throwing construction
     * @return The wired chain, or the TYPE_MISMATCH / INVALID_ARGUMENT error
     */
    static Result<std::shared_ptr<SequentialConsolidator>> create(
        std::shared_ptr<DataConsolidator> first, std::shared_ptr<DataConsolidator> second);

    /**
     * @brief Check whether two consolidators can be chained
     */
    static Result<void> validate(const DataConsolidator* first, const DataConsolidator* second);

    DataType input_type() const override {
        return first_->input_type();
    }

    DataType output_type() const override {
        return second_->output_type();
    }

    /**
     * @brief Forward data unchanged into the first consolidator
     *
     * Anything produced is pushed through second before this returns.
     * Exceptions from either stage propagate to the caller as raised.
     */
    void update(const MarketData& data) override {
        first_->update(data);
    }

    /**
     * @brief Most recent output of the second consolidator
     */
    std::optional<MarketData> consolidated() const override {
        return second_->consolidated();
    }

    const std::shared_ptr<DataConsolidator>& first() const {
        return first_;
    }

    const std::shared_ptr<DataConsolidator>& second() const {
        return second_;
    }

private:
    std::shared_ptr<DataConsolidator> first_;
    std::shared_ptr<DataConsolidator> second_;
    SubscriptionId forward_subscription_{0};
    SubscriptionId republish_subscription_{0};
};

}  // namespace mktflow
