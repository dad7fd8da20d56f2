#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace core {
namespace logging {

    // Creates the process-wide "SignalSynthesis" logger: a coloured console
    // sink plus a rotating file sink (10 MiB x 5) at
    // logs/<base_name>_<UTC start time>.log. SPDLOG_LEVEL overrides both
    // levels. Calling it again replaces the previous logger.
    void initialize(const std::string& base_name = "signal_synthesis",
                    spdlog::level::level_enum console_level = spdlog::level::info,
                    spdlog::level::level_enum file_level = spdlog::level::debug);

    // Throws std::runtime_error before initialize()
    std::shared_ptr<spdlog::logger>& getLogger();

    // "trace" .. "critical", "off"; anything else maps to info
    spdlog::level::level_enum level_from_string(const std::string& level_str);

} // namespace logging
} // namespace core
