// src/consolidators/sequential_consolidator.cpp
#include "mktflow/consolidators/sequential_consolidator.hpp"
#include "mktflow/core/logger.hpp"

namespace mktflow {

Result<void> SequentialConsolidator::validate(const DataConsolidator* first,
                                              const DataConsolidator* second) {
    if (first == nullptr || second == nullptr) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Cannot chain a null consolidator", "SequentialConsolidator");
    }

    if (first == second) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Cannot chain a consolidator to itself", "SequentialConsolidator");
    }

    if (first->output_type() != second->input_type()) {
        return make_error<void>(
            ErrorCode::TYPE_MISMATCH,
            "first.output_type (" + to_string(first->output_type()) +
                ") must equal second.input_type (" + to_string(second->input_type()) + ")",
            "SequentialConsolidator");
    }

    return Result<void>();
}

SequentialConsolidator::SequentialConsolidator(std::shared_ptr<DataConsolidator> first,
                                               std::shared_ptr<DataConsolidator> second) {
    auto valid = validate(first.get(), second.get());
    if (valid.is_error()) {
        ERROR("Refusing to chain consolidators: " << valid.error()->what());
        throw *valid.error();
    }

    first_ = std::move(first);
    second_ = std::move(second);

    // Released in the destructor while second_ is still owned
    DataConsolidator* downstream = second_.get();
    forward_subscription_ =
        first_
            ->subscribe([downstream](const DataConsolidator&, const MarketData& consolidated) {
                downstream->update(consolidated);
            })
            .value();

    republish_subscription_ =
        second_
            ->subscribe([this](const DataConsolidator&, const MarketData& consolidated) {
                notify(consolidated);
            })
            .value();

    DEBUG("Chained " << to_string(first_->input_type()) << " -> "
                     << to_string(first_->output_type()) << " -> "
                     << to_string(second_->output_type()));
}

SequentialConsolidator::~SequentialConsolidator() {
    auto forward = first_->unsubscribe(forward_subscription_);
    if (forward.is_error()) {
        WARN("Failed to release forwarding subscription: " << forward.error()->what());
    }

    auto republish = second_->unsubscribe(republish_subscription_);
    if (republish.is_error()) {
        WARN("Failed to release republishing subscription: " << republish.error()->what());
    }
}

Result<std::shared_ptr<SequentialConsolidator>> SequentialConsolidator::create(
    std::shared_ptr<DataConsolidator> first, std::shared_ptr<DataConsolidator> second) {
    auto valid = validate(first.get(), second.get());
    if (valid.is_error()) {
        ERROR("Refusing to chain consolidators: " << valid.error()->what());
        return make_error<std::shared_ptr<SequentialConsolidator>>(
            valid.error()->code(), valid.error()->what(), valid.error()->component());
    }

    return std::make_shared<SequentialConsolidator>(std::move(first), std::move(second));
}

}  // namespace mktflow
