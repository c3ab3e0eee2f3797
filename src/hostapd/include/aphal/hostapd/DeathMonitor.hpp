// /////////////////////////////////////////////////////////////////////////////
/// @file DeathMonitor.hpp
/// @brief One-shot death notification bound to a remote connection.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <aphal/hostapd/HalContext.hpp>
#include <aphal/hostapd/ISoftApCallback.hpp>
#include <aphal/rpc/IBinder.hpp>
#include <aphal/core/Expected.hpp>
#include <aphal/core/NonCopyable.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace aphal::hostapd {

// /////////////////////////////////////////////////////////////////////////////
/// @class DeathMonitor
/// @brief Watches one binder at a time and reports its death once.
///
/// State machine per link: Idle -> Linked -> (Died | Unlinked).  On death
/// the transport thread posts to the HAL event loop; the posted task takes
/// the HAL lock and fires only if this exact link (same cookie) is still
/// Linked.  It then moves to Died, runs the owner's teardown under the lock,
/// releases the lock and calls the death handler with the cookie.
///
/// @ref link, @ref unlink and the handler setters require the HAL lock.
/// Destroy the monitor under the HAL lock as well.
// /////////////////////////////////////////////////////////////////////////////
class DeathMonitor final : public core::NonCopyable<DeathMonitor>
{
public:
    enum class State : core::u8 {
        kIdle,
        kLinked,
        kDied,
        kUnlinked,
    };

    /// @brief Owner cleanup, run under the HAL lock before the handler.
    using Teardown = std::function<void(core::u64 cookie)>;

    /// @param context Shared HAL context (lock + event loop).
    /// @param tag     Log tag of the owner.
    DeathMonitor(std::shared_ptr<HalContext> context, std::string tag);
    ~DeathMonitor();

    /// @brief Links to @p binder with a fresh process-unique cookie.
    ///        Any previous link is dropped first.
    /// @return The cookie, or kRemoteDied if @p binder is already dead.
    [[nodiscard]] core::Expected<core::u64> link(
        std::shared_ptr<rpc::IBinder> binder, Teardown teardown);

    /// @brief Linked -> Unlinked without notifying anyone.  No-op otherwise.
    void unlink();

    void setHandler(DeathHandler handler);
    void clearHandler();
    [[nodiscard]] bool hasHandler() const noexcept;

    [[nodiscard]] State     state()  const noexcept;
    [[nodiscard]] core::u64 cookie() const noexcept;

private:
    struct Shared;
    std::shared_ptr<Shared> shared_;
};

[[nodiscard]] std::string_view toString(DeathMonitor::State state) noexcept;

} // namespace aphal::hostapd
