// include/mktflow/consolidators/data_consolidator.hpp
#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include <vector>
#include "mktflow/core/error.hpp"
#include "mktflow/core/types.hpp"

namespace mktflow {

class DataConsolidator;

/**
 * @brief Handler fired each time a consolidator produces a value
 */
using DataConsolidatedHandler =
    std::function<void(const DataConsolidator& sender, const MarketData& consolidated)>;

using SubscriptionId = std::size_t;

/**
 * @brief A single stream transformation stage
 *
 * A consolidator declares the type tag it consumes and the type tag it
 * produces, accepts values through update() and announces each produced
 * value to its subscribers. Notification happens inline: every handler has
 * run by the time update() returns. Instances are not synchronized.
 */
class DataConsolidator {
public:
    virtual ~DataConsolidator() = default;

    DataConsolidator(const DataConsolidator&) = delete;
    DataConsolidator& operator=(const DataConsolidator&) = delete;

    /**
     * @brief Type tag of the values accepted by update()
     */
    virtual DataType input_type() const = 0;

    /**
     * @brief Type tag of the values this consolidator produces
     */
    virtual DataType output_type() const = 0;

    /**
     * @brief Feed one value into the consolidator
     * @param data Value whose alternative matches input_type()
     * @throws FlowError on invalid input; exceptions raised by subscribers
     *         propagate unchanged
     */
    virtual void update(const MarketData& data) = 0;

    /**
     * @brief Most recently produced value, empty until the first production
     */
    virtual std::optional<MarketData> consolidated() const = 0;

    /**
     * @brief Register a handler for produced values
     * @param handler Callback, must not be empty
     * @return Result holding the id needed to unsubscribe
     */
    Result<SubscriptionId> subscribe(DataConsolidatedHandler handler);

    /**
     * @brief Remove a previously registered handler
     * @param id Id returned by subscribe()
     * @return Result indicating success or failure
     */
    Result<void> unsubscribe(SubscriptionId id);

    size_t subscriber_count() const {
        return handlers_.size();
    }

    bool is_subscribed(SubscriptionId id) const;

protected:
    DataConsolidator() = default;

    /**
     * @brief Deliver a produced value to every handler, in subscription order
     *
     * A handler removed by an earlier handler in the same dispatch is not
     * called.
     */
    void notify(const MarketData& consolidated) const;

private:
    std::vector<std::pair<SubscriptionId, DataConsolidatedHandler>> handlers_;
    SubscriptionId next_id_{1};
};

}  // namespace mktflow
