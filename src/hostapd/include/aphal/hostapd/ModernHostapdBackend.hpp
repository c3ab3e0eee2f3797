// /////////////////////////////////////////////////////////////////////////////
/// @file ModernHostapdBackend.hpp
/// @brief Backend over the stable hostapd interface.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <aphal/hostapd/IHostapdBackend.hpp>
#include <aphal/hostapd/HalContext.hpp>
#include <aphal/core/NonCopyable.hpp>

#include <memory>

namespace aphal::hostapd {

// /////////////////////////////////////////////////////////////////////////////
/// @class ModernHostapdBackend
/// @brief Talks to @ref IHostapdService.
///
/// The service is fetched once in @ref initialize; the death monitor and
/// the service callback are attached at the same time.  Initialization is
/// started and complete as soon as the service is held.
// /////////////////////////////////////////////////////////////////////////////
class ModernHostapdBackend final : public IHostapdBackend,
                                   public core::NonCopyable<ModernHostapdBackend>
{
public:
    /// @brief Whether the platform declares the stable service.
    [[nodiscard]] static bool serviceDeclared();

    explicit ModernHostapdBackend(std::shared_ptr<HalContext> context);
    ~ModernHostapdBackend() override;

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

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace aphal::hostapd
