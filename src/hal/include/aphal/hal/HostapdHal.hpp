// /////////////////////////////////////////////////////////////////////////////
/// @file HostapdHal.hpp
/// @brief Control-plane facade over the active hostapd backend.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <aphal/hostapd/IHostapdBackend.hpp>
#include <aphal/hostapd/HalConfig.hpp>
#include <aphal/hostapd/HalContext.hpp>
#include <aphal/vendor/VendorParams.hpp>
#include <aphal/concurrency/EventLoop.hpp>
#include <aphal/core/NonCopyable.hpp>

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace aphal::hal {

/// @brief Lifecycle of the facade.
///
/// Uninitialized -> Active by a successful initialize().  Active ->
/// Terminated by terminate() or by the death of the backend.  Terminated
/// -> Active only by another explicit initialize().
enum class HalState : core::u8 {
    kUninitialized,
    kActive,
    kTerminated,
};

[[nodiscard]] std::string_view toString(HalState state) noexcept;

/// @brief Backend providers, in preference order.
enum class BackendKind : core::u8 {
    kModern,
    kLegacy,
};

[[nodiscard]] std::string_view toString(BackendKind kind) noexcept;

// /////////////////////////////////////////////////////////////////////////////
/// @class HostapdHal
/// @brief Owns the single active backend and serializes every call to it.
///
/// Each public operation takes the HAL lock, fails (logged at error level)
/// when there is no active backend, and otherwise delegates.  Asynchronous
/// events run on @p loop, which must outlive the facade.
///
/// @code
///   concurrency::EventLoop loop;
///   hal::HostapdHal hal{loop, hostapd::HalConfig::Builder{}.build()};
///   if (hal.initialize())
///       hal.startAccessPoint("wlan1", config, false, [] { ... });
/// @endcode
// /////////////////////////////////////////////////////////////////////////////
class HostapdHal : public core::NonCopyable<HostapdHal>
{
public:
    HostapdHal(concurrency::EventLoop& loop, hostapd::HalConfig config);
    virtual ~HostapdHal();

    // --------------------------------------------------------------------- //
    //  Lifecycle                                                             //
    // --------------------------------------------------------------------- //

    /// @brief Selects the first declared provider (modern, then legacy),
    ///        initializes it and negotiates the vendor extension.
    /// @return false if a backend is already active, if no provider is
    ///         declared, or if the backend refuses to initialize.
    bool initialize();

    /// @brief Asks the daemon to exit and drops the backend.  The death
    ///        handler is not called.
    void terminate();

    bool isInitializationStarted();
    bool isInitializationComplete();
    bool startDaemon();

    /// @brief Cached and replayed onto backends created later.
    void enableVerboseLogging(bool verboseEnabled, bool halVerboseEnabled);

    // --------------------------------------------------------------------- //
    //  Access point control                                                  //
    // --------------------------------------------------------------------- //

    bool supportsEventCallback();
    bool registerEventCallback(const std::string& ifaceName,
                               std::shared_ptr<hostapd::ISoftApCallback> callback);

    bool startAccessPoint(const std::string& ifaceName, const hostapd::SoftApConfig& config,
                          bool isMetered, hostapd::FailureListener onFailure);
    bool stopAccessPoint(const std::string& ifaceName);
    bool disconnectClient(const std::string& ifaceName, const hostapd::MacAddress& client,
                          hostapd::DisconnectReason reason);

    // --------------------------------------------------------------------- //
    //  Death                                                                 //
    // --------------------------------------------------------------------- //

    /// @brief Replaces the death handler.  It runs on the event loop,
    ///        without the lock, at most once per backend.
    bool registerDeathHandler(hostapd::DeathHandler handler);
    bool deregisterDeathHandler();

    // --------------------------------------------------------------------- //
    //  Vendor extension                                                      //
    // --------------------------------------------------------------------- //

    bool useVendorHostapdHal();
    std::optional<vendor::VendorVersion> vendorVersion();
    bool startVendorAccessPoint(const std::string& ifaceName, const hostapd::SoftApConfig& config,
                                hostapd::FailureListener onFailure);

    // --------------------------------------------------------------------- //
    //  Diagnostics                                                           //
    // --------------------------------------------------------------------- //

    [[nodiscard]] HalState state() const;
    void dump(std::ostream& out);

protected:
    /// @brief Availability probe of @p kind.  Cheap and side-effect free.
    [[nodiscard]] virtual bool isBackendDeclared(BackendKind kind) const;

    /// @brief Instantiates the backend for @p kind.
    [[nodiscard]] virtual std::unique_ptr<hostapd::IHostapdBackend> createBackend(
        BackendKind kind, std::shared_ptr<hostapd::HalContext> context);

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace aphal::hal
