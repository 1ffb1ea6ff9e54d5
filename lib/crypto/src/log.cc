#include "crypto/log.hpp"
#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace Ledger::Log {

namespace {

    constexpr const char* LOGGER_NAME = "ledger";

    std::shared_ptr<spdlog::logger> create(const Settings& settings)
    {
        auto log = spdlog::get(LOGGER_NAME);
        if (!log) {
            log = spdlog::stderr_color_mt(LOGGER_NAME);
        }
        log->set_level(settings.level);
        log->set_pattern(settings.pattern);
        return log;
    }

} // namespace

void init(const Settings& settings)
{
    // level 是原子的, pattern 由 spdlog 内部加锁
    auto& log = logger();
    log.set_level(settings.level);
    log.set_pattern(settings.pattern);
}

spdlog::logger& logger()
{
    static const std::shared_ptr<spdlog::logger> instance = create(Settings {});
    return *instance;
}

} // namespace Ledger::Log
