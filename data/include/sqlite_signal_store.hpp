#pragma once

#include "data_interfaces.hpp"
#include <string>
#include <vector>

namespace data {

    // Signal tables kept in one SQLite file, one table per timeframe, next to
    // a "symbols" table holding the symbol universe. Writes go to a sibling
    // temporary file that is renamed over the store once complete.
    class SqliteSignalStore : public ISignalStore, public ISymbolUniverse {
    public:
        explicit SqliteSignalStore(std::string path, std::string symbols_table = "symbols");

        std::optional<core::SignalTable> readTable(const core::SignalSchema& schema) override;
        void writeTables(const std::vector<core::SignalTable>& tables) override;

        // "Symbols" column of the symbols table (first column if that name is
        // absent), trimmed, blanks and repeats dropped. Empty when missing.
        std::vector<std::string> symbols() override;

        const std::string& path() const { return path_; }

    private:
        std::string path_;
        std::string symbols_table_;
    };

} // namespace data
