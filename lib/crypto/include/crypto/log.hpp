#pragma once

#include <string>

#include <spdlog/spdlog.h>

namespace Ledger::Log {

struct Settings {
    spdlog::level::level_enum level = spdlog::level::info;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";
};

// Reconfigure the shared "ledger" logger in place.
void init(const Settings& settings);

// Shared logger, created once with default Settings on first use.
// The reference stays valid for the life of the process.
spdlog::logger& logger();

} // namespace Ledger::Log
