#pragma once // Use #pragma once for include guards (common practice)

#include <string>
#include <vector>
#include <chrono> // For timestamps
#include <map>    // For trend fields
#include <optional> // For nullable trade journal fields
#include <tuple>
#include <limits>

namespace core {

    // Timestamps are naive wall-clock times: the bar provider strips the
    // timezone before anything reaches the indicator code.
    using Timestamp = std::chrono::system_clock::time_point;

    inline constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

    struct Candle {
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        long long volume = 0; // Use long long for potentially large volumes

        bool operator<(const Candle& other) const {
            return timestamp < other.timestamp;
        }
    };

    // Discrete signal states. "Neutral" is deliberately absent: a pair that
    // does not classify produces no record at all (see SignalClassifier).
    // BuyMinus/SellMinus are only ever read back from older tables.
    enum class SignalState {
        BuyPlus,
        Buy,
        BuyMinus,
        SellPlus,
        Sell,
        SellMinus
    };

    // Indicator values of one bar for one (symbol, timeframe)
    struct IndicatorSnapshot {
        Timestamp timestamp;
        double close = kNaN;
        double stoch_k = kNaN;
        double stoch_d = kNaN;
        double cci = kNaN;
        double plus_di = kNaN;
        double minus_di = kNaN;
        double adx = kNaN;
        double slope_k = kNaN;
        double slope_d = kNaN;
    };

    // User-owned trade journal columns. Never derived from market data.
    struct TradeJournal {
        std::string trade_type; // "Buy", "Sell" or free text
        std::optional<double> entry_price;
        std::optional<double> target_exit_price;
        std::optional<double> exit_price;
        std::optional<double> pnl;
        std::optional<double> pnl_pct;
    };

    // Stored datetime/signal text of a row that could not be parsed back.
    // Such rows are retained as-is; a missing value stays NULL.
    struct UnparsedIdentity {
        std::optional<std::string> datetime;
        std::optional<std::string> signal;
    };

    struct SignalRecord {
        Timestamp timestamp;
        SignalState state = SignalState::Buy;
        std::string symbol;
        double close = kNaN;
        double cci = kNaN;
        double stoch_k = kNaN;
        double stoch_d = kNaN;
        double slope_k = kNaN;
        double slope_d = kNaN;
        double plus_di = kNaN;
        double minus_di = kNaN;
        double adx = kNaN;    // Magnitude, or the stored signed value when no DI pair is known
        std::string notes;
        // Sibling timeframe name -> "up" | "down" | ""
        std::map<std::string, std::string> trends;
        TradeJournal journal;
        // Set only on rows read back with an unparseable datetime or signal;
        // timestamp and state are then meaningless.
        std::optional<UnparsedIdentity> unparsed;

        // ADX carrying the sign of the dominant direction (+ when +DI >= -DI)
        double signedAdx() const;
    };

    // Composite identity used to match records across runs
    using SignalKey = std::tuple<Timestamp, std::string, SignalState>;

    inline SignalKey identityKey(const SignalRecord& record) {
        return SignalKey{record.timestamp, record.symbol, record.state};
    }

    // Static per-timeframe request parameters, e.g. {"daily", "1d", "1y"}
    struct TimeframeConfig {
        std::string name;
        std::string interval;
        std::string period;
    };

    template<typename T>
    using TimeSeries = std::vector<T>;

} // namespace core
