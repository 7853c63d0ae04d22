// apps/consolidate_demo.cpp
//
// Usage: consolidate_demo [pipeline.json] [calendar.json]
//
// Streams a synthetic random-walk tick feed through a configured bar
// pipeline and logs every bar it produces with the venue's open state.

#include <algorithm>
#include <cmath>
#include <iostream>
#include <random>
#include <variant>
#include "mktflow/calendar/trading_calendar.hpp"
#include "mktflow/consolidators/consolidator_factory.hpp"
#include "mktflow/core/logger.hpp"
#include "mktflow/core/time_utils.hpp"

using namespace mktflow;

int main(int argc, char** argv) {
    try {
        LoggerConfig logger_config;
        logger_config.min_level = LogLevel::INFO;
        logger_config.destination = LogDestination::CONSOLE;
        logger_config.filename_prefix = "consolidate_demo";
        Logger::instance().initialize(logger_config);
        Logger::register_component("ConsolidateDemo");

        PipelineConfig pipeline_config;
        pipeline_config.input_type = DataType::TICK;
        pipeline_config.periods_seconds = {1, 60, 300};
        if (argc > 1) {
            auto loaded = pipeline_config.load_from_file(argv[1]);
            if (loaded.is_error()) {
                std::cerr << loaded.error()->to_string() << std::endl;
                return 1;
            }
        }

        CalendarConfig calendar_config;
        if (argc > 2) {
            auto loaded = calendar_config.load_from_file(argv[2]);
            if (loaded.is_error()) {
                std::cerr << loaded.error()->to_string() << std::endl;
                return 1;
            }
        }

        if (pipeline_config.input_type != DataType::TICK) {
            std::cerr << "The demo feed produces ticks; input_type must be TICK" << std::endl;
            return 1;
        }

        auto pipeline_result = ConsolidatorFactory::build(pipeline_config);
        if (pipeline_result.is_error()) {
            std::cerr << pipeline_result.error()->to_string() << std::endl;
            return 1;
        }
        auto pipeline = pipeline_result.value();

        auto calendar_result = TradingCalendar::from_config(calendar_config);
        if (calendar_result.is_error()) {
            std::cerr << calendar_result.error()->to_string() << std::endl;
            return 1;
        }
        TradingCalendar calendar = calendar_result.value();

        size_t bars_emitted = 0;
        auto subscribed =
            pipeline->subscribe([&](const DataConsolidator&, const MarketData& consolidated) {
                const auto& bar = std::get<TradeBar>(consolidated);
                ++bars_emitted;
                INFO(core::format_timestamp(bar.timestamp)
                     << " " << bar.symbol << " O=" << bar.open << " H=" << bar.high
                     << " L=" << bar.low << " C=" << bar.close << " V=" << bar.volume
                     << (calendar.is_open(bar.timestamp) ? "" : " (market closed)"));
            });
        if (subscribed.is_error()) {
            std::cerr << subscribed.error()->to_string() << std::endl;
            return 1;
        }

        // Friday afternoon, so the forex weekend close shows up in the output
        Timestamp start = core::make_timestamp(2024, 1, 5, 15, 40, 0);
        std::mt19937 rng(42);
        std::normal_distribution<double> step(0.0, 0.0001);
        std::uniform_real_distribution<double> size(1000.0, 100000.0);

        Price price = 1.0950;
        const int seconds = 40 * 60;
        for (int s = 0; s < seconds; ++s) {
            Timestamp now = start + std::chrono::seconds(s);
            calendar.set_local_time(now);
            if (!calendar.exchange_open()) {
                continue;
            }

            price = std::max(0.0001, price + step(rng));
            pipeline->update(Tick(now, "EURUSD", price, std::round(size(rng))));
        }

        INFO("Emitted " << bars_emitted << " bars; trading days per year "
                        << calendar.trading_days_per_year());
        return 0;

    } catch (const FlowError& e) {
        std::cerr << e.to_string() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
