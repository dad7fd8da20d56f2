#include "trade_journal.hpp"
#include "utils.hpp"
#include <cmath>

namespace signal_engine {

    PnlResult computePnl(const core::TradeJournal& journal) {
        PnlResult result;
        const std::string type = core::utils::trim(journal.trade_type);
        if (type != "Buy" && type != "Sell") {
            return result;
        }
        if (!journal.entry_price || !journal.exit_price ||
            !std::isfinite(*journal.entry_price) || !std::isfinite(*journal.exit_price)) {
            return result;
        }

        const double entry = *journal.entry_price;
        const double exit = *journal.exit_price;
        result.pnl = (type == "Buy") ? exit - entry : entry - exit;
        if (entry != 0.0) {
            result.pnl_pct = *result.pnl / entry * 100.0;
        }
        return result;
    }

    void refreshPnl(core::TradeJournal& journal) {
        PnlResult result = computePnl(journal);
        journal.pnl = result.pnl;
        journal.pnl_pct = result.pnl_pct;
    }

} // namespace signal_engine
