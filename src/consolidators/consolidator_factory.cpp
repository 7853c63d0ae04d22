// src/consolidators/consolidator_factory.cpp
#include "mktflow/consolidators/consolidator_factory.hpp"
#include <chrono>
#include <string>
#include "mktflow/consolidators/sequential_consolidator.hpp"
#include "mktflow/consolidators/tick_consolidator.hpp"
#include "mktflow/consolidators/trade_bar_consolidator.hpp"
#include "mktflow/core/logger.hpp"

namespace mktflow {

nlohmann::json PipelineConfig::to_json() const {
    nlohmann::json j;
    j["input_type"] = to_string(input_type);
    j["periods_seconds"] = periods_seconds;
    return j;
}

void PipelineConfig::from_json(const nlohmann::json& j) {
    if (j.contains("input_type")) {
        input_type = parse_data_type(j.at("input_type").get<std::string>()).value();
    }
    if (j.contains("periods_seconds")) {
        periods_seconds = j.at("periods_seconds").get<std::vector<int64_t>>();
    }
}

Result<void> ConsolidatorFactory::validate(const PipelineConfig& config) {
    // Longest period representable on the clock's tick count
    const int64_t max_period =
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::duration::max())
            .count();

    if (config.periods_seconds.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Pipeline needs at least one period", "ConsolidatorFactory");
    }

    for (size_t i = 0; i < config.periods_seconds.size(); ++i) {
        int64_t period = config.periods_seconds[i];
        if (period <= 0) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Period must be positive, got " + std::to_string(period),
                                    "ConsolidatorFactory");
        }
        if (period > max_period) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Period " + std::to_string(period) + "s exceeds the " +
                                        std::to_string(max_period) + "s clock range",
                                    "ConsolidatorFactory");
        }
        if (i == 0) {
            continue;
        }

        int64_t previous = config.periods_seconds[i - 1];
        if (period <= previous || period % previous != 0) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Period " + std::to_string(period) +
                                        "s is not a larger multiple of " +
                                        std::to_string(previous) + "s",
                                    "ConsolidatorFactory");
        }
    }

    return Result<void>();
}

Result<std::shared_ptr<DataConsolidator>> ConsolidatorFactory::build(
    const PipelineConfig& config) {
    auto valid = validate(config);
    if (valid.is_error()) {
        ERROR("Invalid pipeline config: " << valid.error()->what());
        return make_error<std::shared_ptr<DataConsolidator>>(
            valid.error()->code(), valid.error()->what(), valid.error()->component());
    }

    std::vector<std::shared_ptr<DataConsolidator>> stages;
    stages.reserve(config.periods_seconds.size());
    for (size_t i = 0; i < config.periods_seconds.size(); ++i) {
        auto period = std::chrono::seconds(config.periods_seconds[i]);
        if (i == 0 && config.input_type == DataType::TICK) {
            stages.push_back(std::make_shared<TickConsolidator>(period));
        } else {
            stages.push_back(std::make_shared<TradeBarConsolidator>(period));
        }
    }

    INFO("Built " << stages.size() << "-stage pipeline from " << to_string(config.input_type));
    return chain(stages);
}

Result<std::shared_ptr<DataConsolidator>> ConsolidatorFactory::chain(
    const std::vector<std::shared_ptr<DataConsolidator>>& stages) {
    if (stages.empty()) {
        return make_error<std::shared_ptr<DataConsolidator>>(
            ErrorCode::INVALID_ARGUMENT, "Cannot chain an empty stage list", "ConsolidatorFactory");
    }

    std::shared_ptr<DataConsolidator> head = stages.back();
    for (auto it = stages.rbegin() + 1; it != stages.rend(); ++it) {
        auto chained = SequentialConsolidator::create(*it, head);
        if (chained.is_error()) {
            return make_error<std::shared_ptr<DataConsolidator>>(
                chained.error()->code(), chained.error()->what(), chained.error()->component());
        }
        head = chained.value();
    }

    return head;
}

}  // namespace mktflow
