#include "yahoo_finance_client.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>

namespace data {

namespace {

    std::optional<double> numberAt(const nlohmann::json& array, std::size_t i) {
        if (!array.is_array() || i >= array.size() || !array[i].is_number()) {
            return std::nullopt;
        }
        return array[i].get<double>();
    }

} // namespace

YahooFinanceClient::YahooFinanceClient(std::string base_url, int timeout_ms)
    : base_url_(std::move(base_url)), timeout_ms_(timeout_ms)
{
    core::logging::getLogger()->debug("YahooFinanceClient created for {}", base_url_);
}

core::TimeSeries<core::Candle> YahooFinanceClient::fetchBars(const std::string& symbol,
                                                             const core::TimeframeConfig& timeframe)
{
    auto logger = core::logging::getLogger();

    std::chrono::seconds lookback{0};
    try {
        lookback = core::utils::parsePeriod(timeframe.period);
    } catch (const std::invalid_argument& e) {
        throw core::ApiRequestException("Bad period for timeframe '" + timeframe.name + "': " + e.what());
    }

    const auto now = std::chrono::system_clock::now();
    const long long period2 = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    const long long period1 = period2 - lookback.count();

    // Symbols like "^NSEI" or "RELIANCE.NS" must be URL-encoded in the path
    const std::string full_url = base_url_ + "/v8/finance/chart/" + std::string(cpr::util::urlEncode(symbol));
    logger->debug("Requesting Yahoo chart {} ({} / {})", full_url, timeframe.interval, timeframe.period);

    cpr::Response response = cpr::Get(cpr::Url{full_url},
                                      cpr::Parameters{{"period1", std::to_string(period1)},
                                                      {"period2", std::to_string(period2)},
                                                      {"interval", timeframe.interval},
                                                      {"includePrePost", "false"}},
                                      cpr::Header{{"Accept", "application/json"},
                                                  {"User-Agent", "Mozilla/5.0"}},
                                      cpr::Timeout{timeout_ms_});

    logger->debug("Yahoo response status: {}, body size: {}", response.status_code, response.text.length());

    if (response.error) {
        throw core::ApiRequestException(fmt::format("Yahoo request for {} failed (CPR error {}): {}",
                                                    symbol, static_cast<int>(response.error.code),
                                                    response.error.message));
    }
    if (response.status_code != 200) {
        throw core::ApiRequestException(fmt::format("Yahoo request for {} returned HTTP {}: {}",
                                                    symbol, response.status_code,
                                                    response.text.substr(0, 200)));
    }

    auto candles = parseChartResponse(response.text);
    logger->debug("Parsed {} bar(s) for {} ({}).", candles.size(), symbol, timeframe.name);
    return candles;
}

core::TimeSeries<core::Candle> YahooFinanceClient::parseChartResponse(const std::string& body)
{
    auto logger = core::logging::getLogger();
    core::TimeSeries<core::Candle> candles;

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw core::ApiRequestException(std::string("Malformed chart response: ") + e.what());
    }

    try {
        const auto& chart = doc.at("chart");
        if (chart.contains("error") && !chart["error"].is_null()) {
            throw core::ApiRequestException("Chart API error: " + chart["error"].value("description", chart["error"].dump()));
        }
        const auto& results = chart.at("result");
        if (!results.is_array() || results.empty()) {
            return candles;
        }
        const auto& result = results.at(0);

        const long long gmtoffset = result.contains("meta") ? result["meta"].value("gmtoffset", 0LL) : 0LL;
        if (!result.contains("timestamp") || !result["timestamp"].is_array()) {
            return candles; // No bars in range
        }
        const auto& timestamps = result["timestamp"];
        const auto& quote = result.at("indicators").at("quote").at(0);

        const nlohmann::json empty = nlohmann::json::array();
        const auto& opens = quote.contains("open") ? quote["open"] : empty;
        const auto& highs = quote.contains("high") ? quote["high"] : empty;
        const auto& lows = quote.contains("low") ? quote["low"] : empty;
        const auto& closes = quote.contains("close") ? quote["close"] : empty;
        const auto& volumes = quote.contains("volume") ? quote["volume"] : empty;

        std::size_t skipped = 0;
        for (std::size_t i = 0; i < timestamps.size(); ++i) {
            const auto open = numberAt(opens, i);
            const auto high = numberAt(highs, i);
            const auto low = numberAt(lows, i);
            const auto close = numberAt(closes, i);
            if (!timestamps[i].is_number() || !open || !high || !low || !close) {
                ++skipped;
                continue;
            }
            core::Candle candle;
            candle.timestamp = core::utils::timestampFromEpoch(timestamps[i].get<long long>(), gmtoffset);
            candle.open = *open;
            candle.high = *high;
            candle.low = *low;
            candle.close = *close;
            candle.volume = static_cast<long long>(numberAt(volumes, i).value_or(0.0));
            candles.push_back(candle);
        }
        if (skipped > 0) {
            logger->trace("Skipped {} incomplete bar(s) in chart response.", skipped);
        }
    } catch (const nlohmann::json::exception& e) {
        throw core::ApiRequestException(std::string("Unexpected chart response structure: ") + e.what());
    }

    std::stable_sort(candles.begin(), candles.end());
    // Keep the last bar of each timestamp (Yahoo repeats the live bar)
    core::TimeSeries<core::Candle> unique;
    unique.reserve(candles.size());
    for (const auto& candle : candles) {
        if (!unique.empty() && unique.back().timestamp == candle.timestamp) {
            unique.back() = candle;
        } else {
            unique.push_back(candle);
        }
    }
    return unique;
}

} // namespace data
