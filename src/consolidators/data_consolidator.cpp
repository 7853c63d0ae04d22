// src/consolidators/data_consolidator.cpp
#include "mktflow/consolidators/data_consolidator.hpp"
#include <algorithm>
#include <string>

namespace mktflow {

Result<SubscriptionId> DataConsolidator::subscribe(DataConsolidatedHandler handler) {
    if (!handler) {
        return make_error<SubscriptionId>(ErrorCode::INVALID_ARGUMENT,
                                          "Handler function cannot be null", "DataConsolidator");
    }

    SubscriptionId id = next_id_++;
    handlers_.emplace_back(id, std::move(handler));
    return id;
}

Result<void> DataConsolidator::unsubscribe(SubscriptionId id) {
    auto it = std::find_if(handlers_.begin(), handlers_.end(),
                           [id](const auto& entry) { return entry.first == id; });
    if (it == handlers_.end()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Subscription not found: " + std::to_string(id),
                                "DataConsolidator");
    }

    handlers_.erase(it);
    return Result<void>();
}

bool DataConsolidator::is_subscribed(SubscriptionId id) const {
    return std::any_of(handlers_.begin(), handlers_.end(),
                       [id](const auto& entry) { return entry.first == id; });
}

void DataConsolidator::notify(const MarketData& consolidated) const {
    // Handlers may subscribe or unsubscribe while being notified. Handlers
    // added during dispatch wait for the next value; removed ones are skipped.
    auto handlers = handlers_;
    for (const auto& [id, handler] : handlers) {
        if (!is_subscribed(id)) {
            continue;
        }
        handler(*this, consolidated);
    }
}

}  // namespace mktflow
