// include/mktflow/consolidators/consolidator_factory.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <vector>
#include "mktflow/consolidators/data_consolidator.hpp"
#include "mktflow/core/config_base.hpp"
#include "mktflow/core/error.hpp"

namespace mktflow {

/**
 * @brief Description of a bar pipeline
 *
 * JSON form: {"input_type": "TICK", "periods_seconds": [1, 60]}
 */
struct PipelineConfig : public ConfigBase {
    DataType input_type{DataType::TICK};
    std::vector<int64_t> periods_seconds;  // One stage per entry, shortest first

    nlohmann::json to_json() const override;

    /**
     * @throws FlowError with INVALID_ARGUMENT for an unknown input type
     */
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Assembles consolidator pipelines from configuration
 */
class ConsolidatorFactory {
public:
    /**
     * @brief Build one stage per period and chain them
     *
     * The first stage consumes config.input_type; later stages roll bars up.
     * Stages are nested to the right: Chain(s1, Chain(s2, s3)).
     *
     * @return The pipeline head, or INVALID_ARGUMENT if the periods are empty,
     *         not positive, too long for the system clock, not strictly
     *         increasing, or a period does not evenly divide its successor
     */
    static Result<std::shared_ptr<DataConsolidator>> build(const PipelineConfig& config);

    /**
     * @brief Chain an ordered list of consolidators right-nested
     * @return The pipeline head, or the first wiring error encountered
     */
    static Result<std::shared_ptr<DataConsolidator>> chain(
        const std::vector<std::shared_ptr<DataConsolidator>>& stages);

private:
    static Result<void> validate(const PipelineConfig& config);
};

}  // namespace mktflow
