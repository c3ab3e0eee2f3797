// /////////////////////////////////////////////////////////////////////////////
/// @file LegacyHostapdBackend.hpp
/// @brief Backend over the versioned 1.x hostapd interface.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <aphal/hostapd/IHostapdBackend.hpp>
#include <aphal/hostapd/HalContext.hpp>
#include <aphal/hostapd/ILegacyHostapdService.hpp>
#include <aphal/core/NonCopyable.hpp>

#include <memory>
#include <optional>

namespace aphal::hostapd {

// /////////////////////////////////////////////////////////////////////////////
/// @class LegacyHostapdBackend
/// @brief Talks to @ref ILegacyHostapdService.
///
/// @ref initialize registers for service registration notifications.  A
/// service that is already running is adopted on the spot; one that comes
/// up later is adopted on the event loop.  Initialization is @e started
/// once the notification is registered and @e complete once the service
/// is held.
///
/// Feature gates by minor version:
///   - 1.1  failure events
///   - 1.2  client disconnect, debug parameters
///   - 1.3  AP info and client events (@ref supportsEventCallback)
// /////////////////////////////////////////////////////////////////////////////
class LegacyHostapdBackend final : public IHostapdBackend,
                                   public core::NonCopyable<LegacyHostapdBackend>
{
public:
    [[nodiscard]] static bool serviceDeclared();

    explicit LegacyHostapdBackend(std::shared_ptr<HalContext> context);
    ~LegacyHostapdBackend() override;

    [[nodiscard]] const char* name() const noexcept override;

    [[nodiscard]] core::Expected<void> initialize() override;
    void enableVerboseLogging(bool verbose, bool halVerbose) override;

    [[nodiscard]] bool supportsEventCallback() const override;
    [[nodiscard]] core::Expected<void> registerEventCallback(
        const std::string& ifaceName, std::shared_ptr<ISoftApCallback> callback) override;

    [[nodiscard]] core::Expected<void> startAccessPoint(
        const std::string& ifaceName, const SoftApConfig& config,
        bool isMetered, FailureListener onFailure) override;
    [[nodiscard]] core::Expected<void> stopAccessPoint(const std::string& ifaceName) override;
    [[nodiscard]] core::Expected<void> disconnectClient(
        const std::string& ifaceName, const MacAddress& client, DisconnectReason reason) override;

    [[nodiscard]] core::Expected<void> registerDeathHandler(DeathHandler handler) override;
    [[nodiscard]] core::Expected<void> deregisterDeathHandler() override;

    [[nodiscard]] bool isInitializationStarted() const override;
    [[nodiscard]] bool isInitializationComplete() const override;
    [[nodiscard]] core::Expected<void> startDaemon() override;

    void terminate() noexcept override;
    void dump(std::ostream& out) const override;

    /// @brief Minor version of the held service, if any.
    [[nodiscard]] std::optional<LegacyVersion> serviceVersion() const;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace aphal::hostapd
