// /////////////////////////////////////////////////////////////////////////////
/// @file IHostapdBackend.hpp
/// @brief Abstract hostapd control backend (Strategy pattern).
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <aphal/hostapd/ApTypes.hpp>
#include <aphal/hostapd/ISoftApCallback.hpp>
#include <aphal/core/Expected.hpp>

#include <memory>
#include <ostream>
#include <string>

namespace aphal::hostapd {

// /////////////////////////////////////////////////////////////////////////////
/// @class IHostapdBackend
/// @brief Strategy interface for one transport generation of hostapd.
///
/// Concrete implementations:
///   - @c ModernHostapdBackend: stable interface, events always available.
///   - @c LegacyHostapdBackend: versioned 1.x interface, lazily adopted.
///
/// Every method except @ref terminate may be refused independently.  The
/// facade calls them with the HAL lock held.
// /////////////////////////////////////////////////////////////////////////////
class IHostapdBackend
{
public:
    virtual ~IHostapdBackend() = default;

    /// @brief Human-readable class name, used in dumps.
    [[nodiscard]] virtual const char* name() const noexcept = 0;

    /// @brief One-time setup.  Calling it twice is a caller bug.
    [[nodiscard]] virtual core::Expected<void> initialize() = 0;

    virtual void enableVerboseLogging(bool verbose, bool halVerbose) = 0;

    [[nodiscard]] virtual bool supportsEventCallback() const = 0;

    /// @brief Replaces the event callback of @p ifaceName.
    [[nodiscard]] virtual core::Expected<void> registerEventCallback(
        const std::string& ifaceName, std::shared_ptr<ISoftApCallback> callback) = 0;

    /// @brief Starts an AP.  @p onFailure fires at most once, on the event loop.
    [[nodiscard]] virtual core::Expected<void> startAccessPoint(
        const std::string& ifaceName, const SoftApConfig& config,
        bool isMetered, FailureListener onFailure) = 0;

    [[nodiscard]] virtual core::Expected<void> stopAccessPoint(const std::string& ifaceName) = 0;

    [[nodiscard]] virtual core::Expected<void> disconnectClient(
        const std::string& ifaceName, const MacAddress& client, DisconnectReason reason) = 0;

    /// @brief Replaces the death handler; registering again does not stack.
    [[nodiscard]] virtual core::Expected<void> registerDeathHandler(DeathHandler handler) = 0;
    [[nodiscard]] virtual core::Expected<void> deregisterDeathHandler() = 0;

    [[nodiscard]] virtual bool isInitializationStarted() const = 0;
    [[nodiscard]] virtual bool isInitializationComplete() const = 0;

    /// @brief Starts the daemon if it is started lazily by the platform.
    [[nodiscard]] virtual core::Expected<void> startDaemon() = 0;

    /// @brief Best-effort shutdown.  Idempotent, never fires the death handler.
    virtual void terminate() noexcept = 0;

    virtual void dump(std::ostream& out) const = 0;
};

} // namespace aphal::hostapd
