/**
 * @file Log.cpp
 * @brief Default ILogger implementation writing to stderr.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#include "aphal/core/Log.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>

namespace aphal::core {

namespace {

class StderrLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        static constexpr const char *kLevelNames[] = {
            "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL"
        };
        const auto idx = static_cast<unsigned>(level);

        std::lock_guard<std::mutex> lock{_mutex};
        std::fprintf(
            stderr,
            "[%s][%.*s] %.*s\n",
            kLevelNames[idx],
            static_cast<int>(tag.size()), tag.data(),
            static_cast<int>(message.size()), message.data()
        );
    }

private:
    std::mutex _mutex;
};

StderrLogger           gDefaultLogger;
std::atomic<ILogger *> gActiveLogger{&gDefaultLogger};
std::atomic<LogLevel>  gMinLevel{LogLevel::kInfo};

} // anonymous namespace

void Log::setLogger(ILogger *logger)  { gActiveLogger.store(logger ? logger : &gDefaultLogger); }
void Log::setMinLevel(LogLevel level) { gMinLevel.store(level); }
LogLevel Log::minLevel()              { return gMinLevel.load(); }

static void dispatch(LogLevel level, std::string_view tag, std::string_view msg)
{
    if (level < gMinLevel.load(std::memory_order_relaxed))
        return;
    gActiveLogger.load()->write(level, tag, msg);
}

void Log::debug(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kDebug, tag, msg); }
void Log::info (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kInfo,  tag, msg); }
void Log::warn (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kWarn,  tag, msg); }
void Log::error(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kError, tag, msg); }
void Log::fatal(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kFatal, tag, msg); }

} // namespace aphal::core
