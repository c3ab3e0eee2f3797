// /////////////////////////////////////////////////////////////////////////////
/// @file CapturingLogger.hpp
/// @brief ILogger that records every entry, for assertions in tests.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <aphal/core/Log.hpp>

#include <algorithm>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace aphal::testing {

class CapturingLogger final : public core::ILogger
{
public:
    struct Entry
    {
        core::LogLevel level;
        std::string    tag;
        std::string    message;
    };

    /// Installs itself at debug level; restores the default sink on exit.
    CapturingLogger()
        : previousLevel_{core::Log::minLevel()}
    {
        core::Log::setLogger(this);
        core::Log::setMinLevel(core::LogLevel::kDebug);
    }

    ~CapturingLogger() override
    {
        core::Log::setLogger(nullptr);
        core::Log::setMinLevel(previousLevel_);
    }

    CapturingLogger(const CapturingLogger&)            = delete;
    CapturingLogger& operator=(const CapturingLogger&) = delete;

    void write(core::LogLevel level, std::string_view tag, std::string_view message) override
    {
        std::lock_guard<std::mutex> lock{mutex_};
        entries_.push_back(Entry{level, std::string{tag}, std::string{message}});
    }

    [[nodiscard]] bool contains(core::LogLevel level, std::string_view needle) const
    {
        std::lock_guard<std::mutex> lock{mutex_};
        return std::any_of(entries_.begin(), entries_.end(), [&](const Entry& e) {
            return e.level == level && e.message.find(needle) != std::string::npos;
        });
    }

    [[nodiscard]] std::size_t count(core::LogLevel level) const
    {
        std::lock_guard<std::mutex> lock{mutex_};
        return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
            [level](const Entry& e) { return e.level == level; }));
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock{mutex_};
        entries_.clear();
    }

private:
    core::LogLevel     previousLevel_;
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

} // namespace aphal::testing
