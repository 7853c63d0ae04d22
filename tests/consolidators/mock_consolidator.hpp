#pragma once

#include <functional>
#include <optional>
#include <vector>
#include "mktflow/consolidators/data_consolidator.hpp"

namespace mktflow {
namespace testing {

/**
 * @brief Consolidator with scriptable behaviour that records its input
 */
class MockConsolidator : public DataConsolidator {
public:
    MockConsolidator(DataType input, DataType output) : input_(input), output_(output) {}

    DataType input_type() const override {
        return input_;
    }
    DataType output_type() const override {
        return output_;
    }

    void update(const MarketData& data) override {
        received.push_back(data);
        if (fail_with) {
            throw *fail_with;
        }
        if (transform) {
            auto produced = transform(data);
            if (produced) {
                emit(*produced);
            }
        }
    }

    std::optional<MarketData> consolidated() const override {
        return consolidated_;
    }

    void emit(const MarketData& value) {
        consolidated_ = value;
        notify(value);
    }

    std::vector<MarketData> received;
    std::optional<FlowError> fail_with;
    std::function<std::optional<MarketData>(const MarketData&)> transform;

private:
    DataType input_;
    DataType output_;
    std::optional<MarketData> consolidated_;
};

}  // namespace testing
}  // namespace mktflow
