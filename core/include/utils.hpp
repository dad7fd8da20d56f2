#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>
#include <optional>

namespace core {
namespace utils {

    // Naive timestamp as "YYYY-MM-DD HH:MM:SS" (the persisted form)
    std::string timestampToString(const Timestamp& ts);

    // Parses "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS" or the ISO 'T' form. Fractional
    // seconds and a trailing "Z"/"+HH:MM" offset are accepted and dropped so the
    // wall-clock reading is kept. Throws std::runtime_error on malformed input.
    Timestamp stringToTimestamp(const std::string& text);

    // Epoch seconds shifted by a UTC offset into a naive local timestamp
    Timestamp timestampFromEpoch(long long epoch_seconds, long long utc_offset_seconds = 0);

    long long timestampToEpoch(const Timestamp& ts);

    // Half-away-from-zero rounding; NaN passes through unchanged
    double roundTo(double value, int decimals = 2);
    std::optional<double> roundTo(const std::optional<double>& value, int decimals = 2);

    // Lookback strings such as "90d", "1wk", "6mo", "3y"
    std::chrono::seconds parsePeriod(const std::string& period);

    std::string signalStateToString(SignalState state);
    std::optional<SignalState> stringToSignalState(const std::string& text);

    std::string trim(const std::string& text);

} // namespace utils
} // namespace core
