// /////////////////////////////////////////////////////////////////////////////
/// @file ApEventRouter.hpp
/// @brief Routes daemon events to per-interface listeners and callbacks.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <aphal/hostapd/HalContext.hpp>
#include <aphal/hostapd/IHostapdService.hpp>
#include <aphal/hostapd/ISoftApCallback.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace aphal::hostapd {

// /////////////////////////////////////////////////////////////////////////////
/// @class ApEventRouter
/// @brief The daemon-facing callback object of a backend.
///
/// Incoming events arrive on a transport thread and are re-posted to the
/// HAL event loop.  There the router takes the HAL lock, looks up the
/// interface, and invokes the caller's code after releasing the lock.
///
/// The failure listener of an interface is one-shot: it is removed when it
/// fires, when the interface is removed, and on @ref clear.
///
/// Mutators require the HAL lock.
// /////////////////////////////////////////////////////////////////////////////
class ApEventRouter final : public IHostapdServiceCallback,
                            public std::enable_shared_from_this<ApEventRouter>
{
public:
    ApEventRouter(std::shared_ptr<HalContext> context, std::string tag);

    void addFailureListener(const std::string& ifaceName, FailureListener listener);
    void setCallback(const std::string& ifaceName, std::shared_ptr<ISoftApCallback> callback);
    /// @brief Forgets both the listener and the callback of @p ifaceName.
    void removeInterface(const std::string& ifaceName);
    void clear();

    [[nodiscard]] bool hasFailureListener(const std::string& ifaceName) const;
    [[nodiscard]] bool hasCallback(const std::string& ifaceName) const;
    [[nodiscard]] core::usize interfaceCount() const;

    // IHostapdServiceCallback
    void onFailure(const std::string& ifaceName, const std::string& instanceName) override;
    void onApInstanceInfoChanged(const ApInfo& info) override;
    void onConnectedClientsChanged(const ClientInfo& client) override;

private:
    void dispatchFailure(const std::string& ifaceName, const std::string& instanceName);
    std::shared_ptr<ISoftApCallback> callbackFor(const std::string& ifaceName);

    std::shared_ptr<HalContext> context_;
    std::string                 tag_;

    // Guarded by the HAL lock.
    std::unordered_map<std::string, FailureListener>                  failureListeners_;
    std::unordered_map<std::string, std::shared_ptr<ISoftApCallback>> callbacks_;
};

} // namespace aphal::hostapd
