// /////////////////////////////////////////////////////////////////////////////
/// @file IHostapdService.hpp
/// @brief Remote interface of hostapd, current (stable) generation.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <aphal/hostapd/ApTypes.hpp>
#include <aphal/rpc/IBinder.hpp>
#include <aphal/core/Expected.hpp>

#include <memory>
#include <string>

namespace aphal::hostapd {

enum class DebugLevel : core::u8 {
    kExcessive = 0,
    kMsgDump,
    kDebug,
    kInfo,
    kWarning,
    kError,
};

// /////////////////////////////////////////////////////////////////////////////
/// @class IHostapdServiceCallback
/// @brief Events the daemon pushes back; called on a transport thread.
// /////////////////////////////////////////////////////////////////////////////
class IHostapdServiceCallback
{
public:
    virtual ~IHostapdServiceCallback() = default;

    virtual void onFailure(const std::string& ifaceName, const std::string& instanceName) = 0;
    virtual void onApInstanceInfoChanged(const ApInfo& info) = 0;
    virtual void onConnectedClientsChanged(const ClientInfo& client) = 0;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class IHostapdService
/// @brief Stable remote interface.  Every call blocks for a round trip.
///
/// Errors come back as @c kBackendRejected (the daemon refused) or
/// @c kRemoteDied (the transport is gone).
// /////////////////////////////////////////////////////////////////////////////
class IHostapdService : public rpc::IInterface
{
public:
    /// @brief Registry name of the default instance.
    static constexpr const char* kServiceName = "aphal.hostapd.IHostapd/default";

    [[nodiscard]] virtual core::Expected<void> addAccessPoint(
        const IfaceParams& ifaceParams, const NetworkParams& networkParams) = 0;

    [[nodiscard]] virtual core::Expected<void> removeAccessPoint(const std::string& ifaceName) = 0;

    [[nodiscard]] virtual core::Expected<void> forceClientDisconnect(
        const std::string& ifaceName, const MacAddress& client, Ieee80211ReasonCode reason) = 0;

    [[nodiscard]] virtual core::Expected<void> registerCallback(
        std::shared_ptr<IHostapdServiceCallback> callback) = 0;

    [[nodiscard]] virtual core::Expected<void> setDebugParams(DebugLevel level) = 0;

    /// @brief Asks the daemon to exit.  Its death follows asynchronously.
    virtual void terminate() = 0;
};

} // namespace aphal::hostapd
