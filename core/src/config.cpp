#include "config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <fstream>
#include <set>
#include <stdexcept>

namespace core {

    using json = nlohmann::json;

    std::vector<std::string> SynthesisConfig::timeframeNames() const {
        std::vector<std::string> names;
        names.reserve(timeframes.size());
        for (const auto& tf : timeframes) {
            names.push_back(tf.name);
        }
        return names;
    }

    namespace config {

        namespace {

            int positiveInt(const json& doc, const char* key, int fallback) {
                if (!doc.contains(key)) return fallback;
                if (!doc[key].is_number_integer()) {
                    throw ConfigException(fmt::format("Config key '{}' must be an integer.", key));
                }
                int value = doc[key].get<int>();
                if (value <= 0) {
                    throw ConfigException(fmt::format("Config key '{}' must be positive, got {}.", key, value));
                }
                return value;
            }

            double number(const json& doc, const char* key, double fallback) {
                if (!doc.contains(key)) return fallback;
                if (!doc[key].is_number()) {
                    throw ConfigException(fmt::format("Config key '{}' must be a number.", key));
                }
                return doc[key].get<double>();
            }

            TimeframeConfig parseTimeframe(const std::string& name, const json& entry) {
                if (!entry.is_object() || !entry.contains("interval") || !entry["interval"].is_string() ||
                    !entry.contains("period") || !entry["period"].is_string()) {
                    throw ConfigException(fmt::format(
                        "Timeframe '{}' requires 'interval' (string) and 'period' (string).", name));
                }
                TimeframeConfig tf{name, entry["interval"].get<std::string>(), entry["period"].get<std::string>()};
                try {
                    utils::parsePeriod(tf.period);
                } catch (const std::invalid_argument& e) {
                    throw ConfigException(fmt::format("Timeframe '{}': {}", name, e.what()));
                }
                return tf;
            }

        } // namespace

        SynthesisConfig defaults() {
            SynthesisConfig cfg;
            cfg.timeframes = {
                {"weekly", "1wk", "3y"},
                {"daily", "1d", "1y"},
                {"4h", "4h", "90d"},
            };
            return cfg;
        }

        SynthesisConfig fromJson(const json& doc) {
            if (!doc.is_object()) {
                throw ConfigException("Configuration root must be a JSON object.");
            }
            SynthesisConfig cfg = defaults();

            try {
                if (doc.contains("store_path")) {
                    cfg.store_path = doc.at("store_path").get<std::string>();
                }

                if (doc.contains("bar_source")) {
                    const auto& src = doc.at("bar_source");
                    const std::string type = src.value("type", std::string("yahoo"));
                    if (type == "yahoo") {
                        cfg.bar_source.type = BarSourceType::Yahoo;
                    } else if (type == "sqlite") {
                        cfg.bar_source.type = BarSourceType::Sqlite;
                    } else {
                        throw ConfigException("Unknown bar_source type: " + type);
                    }
                    cfg.bar_source.path = src.value("path", cfg.bar_source.path);
                    cfg.bar_source.cache = src.value("cache", cfg.bar_source.cache);
                }

                if (doc.contains("symbols")) {
                    cfg.symbols.clear();
                    for (const auto& s : doc.at("symbols")) {
                        std::string symbol = utils::trim(s.get<std::string>());
                        if (!symbol.empty()) cfg.symbols.push_back(symbol);
                    }
                }

                if (doc.contains("timeframes")) {
                    const auto& tfs = doc.at("timeframes");
                    if (!tfs.is_object() || tfs.empty()) {
                        throw ConfigException("'timeframes' must be a non-empty object.");
                    }
                    cfg.timeframes.clear();
                    for (const auto& [name, entry] : tfs.items()) {
                        cfg.timeframes.push_back(parseTimeframe(name, entry));
                    }
                }

                if (doc.contains("stochastic")) {
                    const auto& st = doc.at("stochastic");
                    cfg.indicators.stoch_window = positiveInt(st, "window", cfg.indicators.stoch_window);
                    cfg.indicators.k_smooth = positiveInt(st, "k_smooth", cfg.indicators.k_smooth);
                    cfg.indicators.d_smooth = positiveInt(st, "d_smooth", cfg.indicators.d_smooth);
                }
                cfg.indicators.cci_period = positiveInt(doc, "cci_period", cfg.indicators.cci_period);
                cfg.indicators.dmi_period = positiveInt(doc, "dmi_period", cfg.indicators.dmi_period);
                cfg.indicators.slope_period = positiveInt(doc, "slope_period", cfg.indicators.slope_period);
                cfg.thresholds.adx_threshold = number(doc, "adx_threshold", cfg.thresholds.adx_threshold);
                cfg.thresholds.slope_threshold = number(doc, "slope_threshold", cfg.thresholds.slope_threshold);
            } catch (const json::exception& e) {
                throw ConfigException(fmt::format("Invalid configuration structure: {}", e.what()));
            }

            if (cfg.indicators.slope_period < 2) {
                throw ConfigException("slope_period must be at least 2.");
            }

            // Trend columns are named after timeframes, so names must be unique and non-empty
            std::set<std::string> seen;
            for (const auto& tf : cfg.timeframes) {
                if (tf.name.empty() || !seen.insert(tf.name).second) {
                    throw ConfigException(fmt::format("Duplicate or empty timeframe name '{}'.", tf.name));
                }
            }
            return cfg;
        }

        SynthesisConfig loadFromFile(const std::string& path) {
            auto logger = logging::getLogger();
            logger->info("Loading configuration from: {}", path);

            std::ifstream ifs(path);
            if (!ifs.is_open()) {
                throw ConfigException(fmt::format("Failed to open config file: {}", path));
            }
            json doc;
            try {
                doc = json::parse(ifs);
            } catch (const json::parse_error& e) {
                throw ConfigException(fmt::format("Failed to parse config file '{}': {}", path, e.what()));
            }
            SynthesisConfig cfg = fromJson(doc);
            logger->info("Configuration loaded: {} timeframe(s), store '{}'", cfg.timeframes.size(), cfg.store_path);
            return cfg;
        }

    } // namespace config

} // namespace core
