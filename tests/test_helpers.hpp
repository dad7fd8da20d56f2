#pragma once

#include "datatypes.hpp"
#include "utils.hpp"

#include <chrono>
#include <filesystem>
#include <random>
#include <string>
#include <system_error>
#include <tuple>
#include <vector>

namespace test_helpers {

    inline core::Timestamp ts(const std::string& text) {
        return core::utils::stringToTimestamp(text);
    }

    // Bars one day apart from `start`, high/low one point around the close
    inline core::TimeSeries<core::Candle> barsFromCloses(const std::vector<double>& closes,
                                                         const std::string& start = "2024-01-01") {
        core::TimeSeries<core::Candle> bars;
        core::Timestamp t = ts(start);
        for (double close : closes) {
            core::Candle c;
            c.timestamp = t;
            c.open = close;
            c.high = close + 1.0;
            c.low = close - 1.0;
            c.close = close;
            c.volume = 1000;
            bars.push_back(c);
            t += std::chrono::hours(24);
        }
        return bars;
    }

    // 20 bars falling by 2, then a wide bar closing at its high:
    // with STOCH(5,1,3) and CCI(5) the last bar has K > D and CCI < -100.
    inline core::TimeSeries<core::Candle> buySetupBars(const std::string& start = "2024-01-01") {
        std::vector<double> closes;
        for (int i = 0; i < 20; ++i) closes.push_back(100.0 - 2.0 * i);
        auto bars = barsFromCloses(closes, start);
        core::Candle last = bars.back();
        last.timestamp += std::chrono::hours(24);
        last.high = 57.0;
        last.low = 50.0;
        last.open = 55.0;
        last.close = 57.0;
        bars.push_back(last);
        return bars;
    }

    // Mirror image: K < D and CCI > 100 on the last bar
    inline core::TimeSeries<core::Candle> sellSetupBars(const std::string& start = "2024-01-01") {
        std::vector<double> closes;
        for (int i = 0; i < 20; ++i) closes.push_back(100.0 + 2.0 * i);
        auto bars = barsFromCloses(closes, start);
        core::Candle last = bars.back();
        last.timestamp += std::chrono::hours(24);
        last.high = 150.0;
        last.low = 143.0;
        last.open = 145.0;
        last.close = 143.0;
        bars.push_back(last);
        return bars;
    }

    inline core::SignalRecord makeRecord(const std::string& symbol, const std::string& when,
                                         core::SignalState state, double close = 100.0) {
        core::SignalRecord r;
        r.timestamp = ts(when);
        r.symbol = symbol;
        r.state = state;
        r.close = close;
        r.cci = -150.0;
        r.stoch_k = 60.0;
        r.stoch_d = 40.0;
        r.slope_k = 0.6;
        r.slope_d = 0.6;
        r.plus_di = 30.0;
        r.minus_di = 15.0;
        r.adx = 25.0;
        return r;
    }

    // Unique scratch directory, removed with everything in it
    class TempDir {
    public:
        TempDir() {
            std::random_device rd;
            std::mt19937_64 gen(rd());
            path_ = std::filesystem::temp_directory_path() /
                    ("signal_synthesis_test_" + std::to_string(gen()));
            std::filesystem::create_directories(path_);
        }
        ~TempDir() {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }
        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        std::string file(const std::string& name) const { return (path_ / name).string(); }
        const std::filesystem::path& path() const { return path_; }

    private:
        std::filesystem::path path_;
    };

} // namespace test_helpers
