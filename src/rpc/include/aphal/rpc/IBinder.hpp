// /////////////////////////////////////////////////////////////////////////////
/// @file IBinder.hpp
/// @brief Opaque handle to a remote service connection.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <aphal/core/Types.hpp>
#include <aphal/core/Expected.hpp>

#include <memory>
#include <string_view>

namespace aphal::rpc {

// /////////////////////////////////////////////////////////////////////////////
/// @class DeathRecipient
/// @brief Notified when the process behind a binder goes away.
///
/// @ref binderDied runs on the transport's own thread, never on a thread
/// that is inside a call on the same binder.  Implementations must hand the
/// event off quickly (typically by posting to an event loop).
// /////////////////////////////////////////////////////////////////////////////
class DeathRecipient
{
public:
    virtual ~DeathRecipient() = default;

    /// @param cookie Value passed to @ref IBinder::linkToDeath.
    virtual void binderDied(core::u64 cookie) = 0;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class IBinder
/// @brief Strategy interface for the connection to a remote object.
///
/// Recipients are held weakly: a destroyed recipient is silently skipped.
// /////////////////////////////////////////////////////////////////////////////
class IBinder
{
public:
    virtual ~IBinder() = default;

    /// @brief Whether the remote end is still reachable.
    [[nodiscard]] virtual bool isAlive() const noexcept = 0;

    /// @brief Registers @p recipient for a one-shot death notification.
    /// @return kRemoteDied if the binder is already dead.
    [[nodiscard]] virtual core::Expected<void> linkToDeath(
        std::weak_ptr<DeathRecipient> recipient, core::u64 cookie) = 0;

    /// @brief Removes every registration of @p recipient.
    /// @return true if something was unlinked.
    virtual bool unlinkToDeath(const DeathRecipient* recipient) = 0;

    /// @brief Interface descriptor of the object behind the binder.
    [[nodiscard]] virtual std::string_view descriptor() const noexcept = 0;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class IInterface
/// @brief Base of every remote service interface.
// /////////////////////////////////////////////////////////////////////////////
class IInterface
{
public:
    virtual ~IInterface() = default;

    /// @brief The connection this proxy talks through.
    [[nodiscard]] virtual std::shared_ptr<IBinder> asBinder() = 0;
};

} // namespace aphal::rpc
