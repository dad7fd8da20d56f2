// cli/src/main.cpp

#include <iostream>
#include <string>
#include <exception>
#include <filesystem>
#include <memory>

#include "logging.hpp"
#include "exceptions.hpp"
#include "config.hpp"
#include "data_interfaces.hpp"
#include "sqlite_signal_store.hpp"
#include "sqlite_bar_provider.hpp"
#include "caching_bar_provider.hpp"
#include "yahoo_finance_client.hpp"
#include "synthesis_runner.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>

namespace {

    const char* kDefaultConfigPath = "config/signal_synthesis.json";

    core::SynthesisConfig loadConfig(int argc, char* argv[]) {
        auto logger = core::logging::getLogger();
        if (argc > 1) {
            return core::config::loadFromFile(argv[1]);
        }
        if (std::filesystem::exists(kDefaultConfigPath)) {
            return core::config::loadFromFile(kDefaultConfigPath);
        }
        logger->warn("No config file given and '{}' not found; using built-in defaults.", kDefaultConfigPath);
        return core::config::defaults();
    }

    std::unique_ptr<data::IBarProvider> makeBarProvider(const core::BarSourceConfig& source) {
        switch (source.type) {
            case core::BarSourceType::Sqlite:
                return std::make_unique<data::SqliteBarProvider>(source.path);
            case core::BarSourceType::Yahoo:
                break;
        }
        return std::make_unique<data::YahooFinanceClient>();
    }

    // Yahoo bars are also written to bar_source.path when caching is on
    std::unique_ptr<data::IBarProvider> makeBarCache(const core::BarSourceConfig& source,
                                                     data::IBarProvider& upstream) {
        if (source.type != core::BarSourceType::Yahoo || !source.cache) {
            return nullptr;
        }
        core::logging::getLogger()->info("Caching fetched bars in '{}'.", source.path);
        return std::make_unique<data::CachingBarProvider>(upstream, source.path);
    }

} // namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;

    try {
        core::logging::initialize("signal_synthesis", spdlog::level::info, spdlog::level::debug);
        logger = core::logging::getLogger();
        logger->info("Signal Synthesis CLI starting...");

        core::SynthesisConfig config = loadConfig(argc, argv);

        data::SqliteSignalStore store(config.store_path);
        auto bars = makeBarProvider(config.bar_source);
        auto bar_cache = makeBarCache(config.bar_source, *bars);
        data::IBarProvider& bar_source = bar_cache ? *bar_cache : *bars;

        // Symbols from the config win over the store's symbols table
        std::unique_ptr<data::ISymbolUniverse> static_universe;
        data::ISymbolUniverse* universe = &store;
        if (!config.symbols.empty()) {
            static_universe = std::make_unique<data::StaticSymbolUniverse>(config.symbols);
            universe = static_universe.get();
            logger->info("Using {} symbol(s) from configuration.", config.symbols.size());
        } else {
            logger->info("Using the symbols table of '{}'.", config.store_path);
        }

        synthesis::SynthesisRunner runner(config, bar_source, *universe, store);
        synthesis::RunSummary summary = runner.run();

        logger->info("Signal Synthesis CLI finished: {} symbol(s), {} pair(s) processed, {} skipped.",
                     summary.symbols, summary.pairs_processed, summary.pairs_skipped);

    } catch (const core::ConfigException& ex) {
        std::cerr << "Configuration Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Configuration Error: {}", ex.what());
        return 1;
    } catch (const core::StoreWriteException& ex) {
        std::cerr << "Store Write Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Store Write Error: {}", ex.what());
        return 2;
    } catch (const core::SignalSynthesisException& ex) {
        std::cerr << "Synthesis Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Synthesis Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }

    return 0;
}
