// /////////////////////////////////////////////////////////////////////////////
/// @file ILegacyHostapdService.hpp
/// @brief Remote interface of hostapd, legacy versioned generation.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <aphal/hostapd/ApTypes.hpp>
#include <aphal/hostapd/IHostapdService.hpp>
#include <aphal/rpc/IBinder.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace aphal::hostapd {

/// @brief Minor versions of the legacy interface, oldest first.
enum class LegacyVersion : core::u8 {
    kV1_0 = 0,
    kV1_1,
    kV1_2,
    kV1_3,
};

[[nodiscard]] constexpr std::string_view toString(LegacyVersion v) noexcept
{
    switch (v)
    {
        case LegacyVersion::kV1_0: return "1.0";
        case LegacyVersion::kV1_1: return "1.1";
        case LegacyVersion::kV1_2: return "1.2";
        case LegacyVersion::kV1_3: return "1.3";
    }
    return "?";
}

enum class LegacyStatusCode : core::u8 {
    kSuccess = 0,
    kFailureUnknown,
    kFailureArgsInvalid,
    kFailureIfaceUnknown,
    kFailureIfaceExists,
    kFailureClientUnknown,
};

/// @brief Status reply of every legacy call.
struct LegacyStatus
{
    LegacyStatusCode code{LegacyStatusCode::kSuccess};
    std::string      debugMessage;

    [[nodiscard]] bool ok() const noexcept { return code == LegacyStatusCode::kSuccess; }
};

// /////////////////////////////////////////////////////////////////////////////
/// @class ILegacyHostapdService
/// @brief Legacy remote interface.  Methods newer than @ref version()
///        answer @c kFailureUnknown.
///
/// A call on a dead transport answers @c kFailureUnknown with a debug
/// message; callers check @c asBinder()->isAlive() to tell the two apart.
// /////////////////////////////////////////////////////////////////////////////
class ILegacyHostapdService : public rpc::IInterface
{
public:
    static constexpr const char* kServiceName = "aphal.hostapd@1.x::IHostapd/default";

    [[nodiscard]] virtual LegacyVersion version() const noexcept = 0;

    [[nodiscard]] virtual LegacyStatus addAccessPoint(
        const IfaceParams& ifaceParams, const NetworkParams& networkParams) = 0;

    [[nodiscard]] virtual LegacyStatus removeAccessPoint(const std::string& ifaceName) = 0;

    /// @since 1.2
    [[nodiscard]] virtual LegacyStatus forceClientDisconnect(
        const std::string& ifaceName, const MacAddress& client, Ieee80211ReasonCode reason) = 0;

    /// @since 1.1 (failure events), 1.3 (info / client events)
    [[nodiscard]] virtual LegacyStatus registerCallback(
        std::shared_ptr<IHostapdServiceCallback> callback) = 0;

    /// @since 1.2
    [[nodiscard]] virtual LegacyStatus setDebugParams(DebugLevel level) = 0;

    virtual void terminate() = 0;
};

} // namespace aphal::hostapd
