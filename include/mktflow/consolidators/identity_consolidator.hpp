// include/mktflow/consolidators/identity_consolidator.hpp
#pragma once

#include <optional>
#include "mktflow/consolidators/data_consolidator.hpp"

namespace mktflow {

/**
 * @brief Emits every input unchanged, e.g. to tap a pipeline
 */
class IdentityConsolidator : public DataConsolidator {
public:
    explicit IdentityConsolidator(DataType type) : type_(type) {}

    DataType input_type() const override {
        return type_;
    }
    DataType output_type() const override {
        return type_;
    }

    /**
     * @throws FlowError if data does not carry the declared type
     */
    void update(const MarketData& data) override;

    std::optional<MarketData> consolidated() const override {
        return consolidated_;
    }

private:
    DataType type_;
    std::optional<MarketData> consolidated_;
};

}  // namespace mktflow
