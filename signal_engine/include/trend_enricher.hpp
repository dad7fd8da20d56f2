#pragma once

#include "datatypes.hpp"
#include "trend_lookup.hpp"
#include <string>
#include <vector>

namespace signal_engine {

    // Attaches one trend field per sibling timeframe to each signal record.
    // Indicator values are never touched.
    class TrendEnricher {
    public:
        TrendEnricher(std::vector<std::string> timeframes, const TrendLookup& lookup);

        void enrich(std::vector<core::SignalRecord>& records, const std::string& own_timeframe) const;

    private:
        std::vector<std::string> timeframes_;
        const TrendLookup& lookup_;
    };

} // namespace signal_engine
