#include "trend_lookup.hpp"

namespace signal_engine {

    TrendLookup::Builder& TrendLookup::Builder::record(const std::string& symbol, const std::string& timeframe,
                                                       double k, double d)
    {
        entries_[{symbol, timeframe}] = {k, d};
        return *this;
    }

    TrendLookup TrendLookup::Builder::build() {
        return TrendLookup(std::move(entries_));
    }

    TrendLookup::TrendLookup(std::map<std::pair<std::string, std::string>, std::pair<double, double>> entries)
        : entries_(std::move(entries)) {}

    std::string TrendLookup::trendOf(const std::string& symbol, const std::string& timeframe) const {
        auto it = entries_.find({symbol, timeframe});
        if (it == entries_.end()) {
            return "";
        }
        const auto [k, d] = it->second;
        if (k > d) return "up";
        if (k < d) return "down";
        return ""; // equal, or either side NaN
    }

} // namespace signal_engine
