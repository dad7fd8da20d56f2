#pragma once

#include "datatypes.hpp"
#include "signal_schema.hpp"
#include <optional>
#include <string>
#include <vector>

namespace data {

    // Source of OHLC bars, ascending by timestamp, timezone already stripped.
    // May return an empty series; may throw on transport errors.
    class IBarProvider {
    public:
        virtual ~IBarProvider() = default;
        virtual core::TimeSeries<core::Candle> fetchBars(const std::string& symbol,
                                                         const core::TimeframeConfig& timeframe) = 0;
    };

    // The set of symbols a run processes
    class ISymbolUniverse {
    public:
        virtual ~ISymbolUniverse() = default;
        virtual std::vector<std::string> symbols() = 0;
    };

    // Persisted per-timeframe signal tables
    class ISignalStore {
    public:
        virtual ~ISignalStore() = default;

        // nullopt when the table does not exist yet.
        // Throws core::StoreReadException when it exists but cannot be read.
        virtual std::optional<core::SignalTable> readTable(const core::SignalSchema& schema) = 0;

        // Replaces the given tables in one atomic step, leaving every other
        // table untouched. Throws core::StoreWriteException; on failure the
        // previous store is still intact.
        virtual void writeTables(const std::vector<core::SignalTable>& tables) = 0;
    };

    class StaticSymbolUniverse : public ISymbolUniverse {
    public:
        explicit StaticSymbolUniverse(std::vector<std::string> symbols) : symbols_(std::move(symbols)) {}
        std::vector<std::string> symbols() override { return symbols_; }

    private:
        std::vector<std::string> symbols_;
    };

} // namespace data
