#pragma once

#include "datatypes.hpp"
#include <optional>

namespace signal_engine {

    struct PnlResult {
        std::optional<double> pnl;
        std::optional<double> pnl_pct;
    };

    // Buy: exit - entry, Sell: entry - exit, percent relative to entry.
    // Empty when the trade type is not Buy/Sell or a price is missing;
    // the percentage is empty when the entry price is zero.
    PnlResult computePnl(const core::TradeJournal& journal);

    // Recomputes the derived PNL columns from the user-entered ones
    void refreshPnl(core::TradeJournal& journal);

} // namespace signal_engine
