#include "utils.hpp"
#include <iomanip>    // For std::put_time, std::get_time
#include <sstream>
#include <string>
#include <stdexcept>  // For std::runtime_error
#include <cmath>      // For std::pow, std::round
#include <cctype>
#include <ctime>

namespace core {
namespace utils {

    namespace {

        std::time_t utcTimeFromTm(std::tm& tm) {
            // timegm reads the struct as UTC figures, which is what a naive
            // timestamp needs. Use _mkgmtime on Windows.
            #ifdef _WIN32
                return _mkgmtime(&tm);
            #else
                return timegm(&tm);
            #endif
        }

    } // namespace

    Timestamp stringToTimestamp(const std::string& text) {
        const std::string input = trim(text);
        std::tm tm = {};
        std::istringstream ss(input);

        // 1. Date, then an optional time part separated by 'T' or ' '
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse timestamp (date part): " + text);
        }
        if (ss.peek() == 'T' || ss.peek() == ' ') {
            ss.ignore();
            ss >> std::get_time(&tm, "%H:%M:%S");
            if (ss.fail()) {
                throw std::runtime_error("Failed to parse timestamp (time part): " + text);
            }
        }

        // 2. Fractional seconds, kept to nanosecond precision
        double fractional_seconds = 0.0;
        if (ss.peek() == '.') {
            ss.ignore();
            std::string digits;
            while (std::isdigit(ss.peek())) {
                char c = static_cast<char>(ss.get());
                if (digits.size() < 9) digits += c;
            }
            if (!digits.empty()) {
                fractional_seconds = std::stod(digits) / std::pow(10.0, static_cast<double>(digits.size()));
            }
        }

        // 3. Timezone designator: validated, then discarded
        char designator = 0;
        if (ss >> designator) {
            if (designator == '+' || designator == '-') {
                int offset_h = 0;
                int offset_m = 0;
                char colon = ' ';
                if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                    throw std::runtime_error("Failed to parse timestamp (timezone offset HH:MM): " + text);
                }
            } else if (designator != 'Z') {
                throw std::runtime_error("Unexpected trailing characters in timestamp: " + text);
            }
        }

        std::time_t tt = utcTimeFromTm(tm);
        if (tt == static_cast<std::time_t>(-1)) {
            throw std::runtime_error("Failed to convert parsed date/time to epoch seconds: " + text);
        }

        auto tp = std::chrono::system_clock::from_time_t(tt);
        tp += std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(fractional_seconds));
        return tp;
    }

    std::string timestampToString(const Timestamp& ts) {
        auto tt = std::chrono::system_clock::to_time_t(ts);
        std::tm time_tm;
        #ifdef _WIN32
            gmtime_s(&time_tm, &tt);
        #else
            gmtime_r(&tt, &time_tm);
        #endif
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%d %H:%M:%S");
        return oss.str();
    }

    Timestamp timestampFromEpoch(long long epoch_seconds, long long utc_offset_seconds) {
        return Timestamp(std::chrono::seconds(epoch_seconds + utc_offset_seconds));
    }

    long long timestampToEpoch(const Timestamp& ts) {
        return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    }

    double roundTo(double value, int decimals) {
        if (!std::isfinite(value)) {
            return value;
        }
        const double scale = std::pow(10.0, decimals);
        return std::round(value * scale) / scale;
    }

    std::optional<double> roundTo(const std::optional<double>& value, int decimals) {
        if (!value) return std::nullopt;
        return roundTo(*value, decimals);
    }

    std::chrono::seconds parsePeriod(const std::string& period) {
        const std::string p = trim(period);
        size_t pos = 0;
        while (pos < p.size() && std::isdigit(static_cast<unsigned char>(p[pos]))) {
            ++pos;
        }
        if (pos == 0 || pos == p.size()) {
            throw std::invalid_argument("Invalid period string: '" + period + "'");
        }
        const long long count = std::stoll(p.substr(0, pos));
        const std::string unit = p.substr(pos);
        if (count <= 0) {
            throw std::invalid_argument("Period must be positive: '" + period + "'");
        }

        constexpr long long day = 24LL * 60 * 60;
        if (unit == "d") return std::chrono::seconds(count * day);
        if (unit == "wk") return std::chrono::seconds(count * 7 * day);
        if (unit == "mo") return std::chrono::seconds(count * 30 * day);
        if (unit == "y") return std::chrono::seconds(count * 365 * day);
        throw std::invalid_argument("Unknown period unit '" + unit + "' in '" + period + "'");
    }

    std::string signalStateToString(SignalState state) {
        switch (state) {
            case SignalState::BuyPlus:   return "Buy+";
            case SignalState::Buy:       return "Buy";
            case SignalState::BuyMinus:  return "Buy-";
            case SignalState::SellPlus:  return "Sell+";
            case SignalState::Sell:      return "Sell";
            case SignalState::SellMinus: return "Sell-";
        }
        return "";
    }

    std::optional<SignalState> stringToSignalState(const std::string& text) {
        const std::string s = trim(text);
        if (s == "Buy+") return SignalState::BuyPlus;
        if (s == "Buy") return SignalState::Buy;
        if (s == "Buy-") return SignalState::BuyMinus;
        if (s == "Sell+") return SignalState::SellPlus;
        if (s == "Sell") return SignalState::Sell;
        if (s == "Sell-") return SignalState::SellMinus;
        return std::nullopt;
    }

    std::string trim(const std::string& text) {
        const auto first = text.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return "";
        const auto last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }

} // namespace utils
} // namespace core
