// src/consolidators/identity_consolidator.cpp
#include "mktflow/consolidators/identity_consolidator.hpp"

namespace mktflow {

void IdentityConsolidator::update(const MarketData& data) {
    if (data_type_of(data) != type_) {
        throw FlowError(ErrorCode::INVALID_DATA,
                        "Expected " + to_string(type_) + " but received " +
                            to_string(data_type_of(data)),
                        "IdentityConsolidator");
    }

    consolidated_ = data;
    notify(data);
}

}  // namespace mktflow
