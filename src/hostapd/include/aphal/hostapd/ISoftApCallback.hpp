// /////////////////////////////////////////////////////////////////////////////
/// @file ISoftApCallback.hpp
/// @brief Caller-facing access point event sink and handler aliases.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <aphal/hostapd/ApTypes.hpp>
#include <aphal/core/Types.hpp>

#include <functional>
#include <string>

namespace aphal::hostapd {

// /////////////////////////////////////////////////////////////////////////////
/// @class ISoftApCallback
/// @brief Receives events for one access point interface.
///
/// Always invoked on the HAL event loop, never with the HAL lock held.
// /////////////////////////////////////////////////////////////////////////////
class ISoftApCallback
{
public:
    virtual ~ISoftApCallback() = default;

    /// @brief The whole AP failed.
    virtual void onFailure() = 0;

    /// @brief One instance of a bridged AP failed.
    virtual void onInstanceFailure(const std::string& apIfaceInstance) = 0;

    /// @brief Operating parameters of an instance changed.
    virtual void onInfoChanged(const ApInfo& info) = 0;

    /// @brief A station joined or left.
    virtual void onConnectedClientsChanged(const ClientInfo& client) = 0;
};

/// @brief One-shot listener fired when an AP fails asynchronously.
using FailureListener = std::function<void()>;

/// @brief Invoked once per remote death with the cookie of the dead link.
using DeathHandler = std::function<void(core::u64 cookie)>;

} // namespace aphal::hostapd
