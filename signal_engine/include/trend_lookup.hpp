#pragma once

#include <map>
#include <string>
#include <utility>

namespace signal_engine {

    // Read-only table of the latest (%K, %D) pair per (symbol, timeframe).
    // Filled through a Builder while signals are computed, then frozen
    // before enrichment starts.
    class TrendLookup {
    public:
        class Builder {
        public:
            // Later calls for the same pair replace the earlier value
            Builder& record(const std::string& symbol, const std::string& timeframe, double k, double d);
            TrendLookup build();

        private:
            std::map<std::pair<std::string, std::string>, std::pair<double, double>> entries_;
        };

        TrendLookup() = default;

        // "up" when K > D, "down" when K < D, "" when missing, equal or NaN
        std::string trendOf(const std::string& symbol, const std::string& timeframe) const;

        std::size_t size() const { return entries_.size(); }

    private:
        explicit TrendLookup(std::map<std::pair<std::string, std::string>, std::pair<double, double>> entries);

        std::map<std::pair<std::string, std::string>, std::pair<double, double>> entries_;
    };

} // namespace signal_engine
