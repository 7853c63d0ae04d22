// include/mktflow/consolidators/data_consolidator_base.hpp
#pragma once

#include <optional>
#include <string>
#include <variant>
#include "mktflow/consolidators/data_consolidator.hpp"

namespace mktflow {

namespace detail {

template <typename T>
struct data_type_tag;

template <>
struct data_type_tag<Tick> {
    static constexpr DataType value = DataType::TICK;
};

template <>
struct data_type_tag<TradeBar> {
    static constexpr DataType value = DataType::TRADE_BAR;
};

}  // namespace detail

/**
 * @brief Consolidator base bound to concrete input and output alternatives
 *
 * Unwraps MarketData into TInput before handing it to update_typed() and
 * keeps the most recently produced TOutput.
 */
template <typename TInput, typename TOutput>
class DataConsolidatorBase : public DataConsolidator {
public:
    DataType input_type() const override {
        return detail::data_type_tag<TInput>::value;
    }

    DataType output_type() const override {
        return detail::data_type_tag<TOutput>::value;
    }

    void update(const MarketData& data) override {
        const TInput* input = std::get_if<TInput>(&data);
        if (input == nullptr) {
            throw FlowError(ErrorCode::INVALID_DATA,
                            "Expected " + to_string(input_type()) + " but received " +
                                to_string(data_type_of(data)),
                            name());
        }
        update_typed(*input);
    }

    std::optional<MarketData> consolidated() const override {
        if (!consolidated_) {
            return std::nullopt;
        }
        return MarketData(*consolidated_);
    }

    /**
     * @brief Typed view of the most recently produced value
     */
    const std::optional<TOutput>& last_consolidated() const {
        return consolidated_;
    }

protected:
    /**
     * @brief Component name used in error messages
     */
    virtual std::string name() const = 0;

    virtual void update_typed(const TInput& data) = 0;

    /**
     * @brief Record a produced value and fire the notification
     */
    void on_data_consolidated(const TOutput& consolidated) {
        consolidated_ = consolidated;
        notify(MarketData(consolidated));
    }

private:
    std::optional<TOutput> consolidated_;
};

}  // namespace mktflow
