// /////////////////////////////////////////////////////////////////////////////
/// @file HalContext.hpp
/// @brief State shared by the facade and everything it owns.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <aphal/hostapd/HalConfig.hpp>
#include <aphal/concurrency/EventLoop.hpp>
#include <aphal/core/NonCopyable.hpp>

#include <mutex>

namespace aphal::hostapd {

/// @brief The serialization lock, the event loop and the configuration.
///
/// Held through @c std::shared_ptr by the facade and its backends so that
/// asynchronous tasks can reach the lock after their owner is gone.  The
/// event loop itself must outlive every HalContext that refers to it.
struct HalContext final : core::NonMovable<HalContext>
{
    HalContext(concurrency::EventLoop& eventLoop, HalConfig halConfig)
        : loop{eventLoop}, config{std::move(halConfig)}
    {}

    std::mutex              lock;
    concurrency::EventLoop& loop;
    const HalConfig         config;

    // Guarded by lock.
    bool verboseLogging{false};
    bool halVerboseLogging{false};
};

} // namespace aphal::hostapd
