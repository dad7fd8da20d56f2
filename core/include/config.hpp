#pragma once

#include "datatypes.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace core {

    // Window lengths used by the IndicatorEngine
    struct IndicatorParams {
        int stoch_window = 55;   // raw %K look-back
        int k_smooth = 55;       // SMA length producing %K
        int d_smooth = 36;       // SMA length producing %D
        int cci_period = 20;
        int dmi_period = 14;
        int slope_period = 10;
    };

    struct ClassifierThresholds {
        double adx_threshold = 20.0;
        double slope_threshold = 0.5;
    };

    enum class BarSourceType {
        Yahoo,
        Sqlite
    };

    struct BarSourceConfig {
        BarSourceType type = BarSourceType::Yahoo;
        std::string path = "market_data.db"; // Read by the SQLite source, written by the cache
        bool cache = false; // Yahoo only: also store fetched bars in `path`
    };

    struct SynthesisConfig {
        std::string store_path = "trading_synthesis.db";
        BarSourceConfig bar_source;
        std::vector<std::string> symbols; // Empty -> read the store's symbols table
        std::vector<TimeframeConfig> timeframes;
        IndicatorParams indicators;
        ClassifierThresholds thresholds;

        std::vector<std::string> timeframeNames() const;
    };

    namespace config {

        // weekly/1wk/3y, daily/1d/1y, 4h/4h/90d and the default windows
        SynthesisConfig defaults();

        // Missing keys keep their defaults. Throws ConfigException.
        SynthesisConfig fromJson(const nlohmann::json& doc);

        SynthesisConfig loadFromFile(const std::string& path);

    } // namespace config

} // namespace core
