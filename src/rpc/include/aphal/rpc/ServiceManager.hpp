// /////////////////////////////////////////////////////////////////////////////
/// @file ServiceManager.hpp
/// @brief Process-wide registry of declared and running remote services.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <aphal/rpc/IBinder.hpp>
#include <aphal/core/Types.hpp>
#include <aphal/core/NonCopyable.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace aphal::rpc {

// /////////////////////////////////////////////////////////////////////////////
/// @class ServiceManager
/// @brief Stands in for the platform's service discovery.
///
/// A service is @e declared when the platform manifest lists it (it may be
/// started lazily) and @e running once an instance has been added.
/// Availability probes only read the declaration table: they never block
/// and never start anything.
///
/// Registration listeners are invoked on the thread calling
/// @ref addService, outside the registry lock.
// /////////////////////////////////////////////////////////////////////////////
class ServiceManager final : public core::NonCopyable<ServiceManager>
{
public:
    using Listener = std::function<void(const std::shared_ptr<IInterface>&)>;
    using ListenerToken = core::u64;

    /// @brief The process-wide instance.
    static ServiceManager& instance();

    ServiceManager();
    ~ServiceManager();

    /// @brief Lists @p name in the manifest without starting it.
    void declare(std::string_view name);

    /// @brief Publishes a running instance (implies @ref declare) and
    ///        notifies registration listeners.
    void addService(std::string_view name, std::shared_ptr<IInterface> service);

    /// @brief Withdraws the running instance; the declaration stays.
    void removeService(std::string_view name);

    /// @brief Cheap, side-effect-free manifest lookup.
    [[nodiscard]] bool isDeclared(std::string_view name) const;

    /// @brief Running instance, or nullptr.  Never blocks.
    [[nodiscard]] std::shared_ptr<IInterface> getService(std::string_view name) const;

    /// @brief Typed variant of @ref getService.
    template <typename T>
    [[nodiscard]] std::shared_ptr<T> getService(std::string_view name) const
    {
        return std::dynamic_pointer_cast<T>(getService(name));
    }

    /// @brief Calls @p listener for every future @ref addService of @p name,
    ///        and immediately if the service is already running.
    [[nodiscard]] ListenerToken registerForNotifications(std::string_view name, Listener listener);

    /// @brief Removes a listener.  Unknown tokens are ignored.
    void unregisterForNotifications(ListenerToken token);

    /// @brief Names of every declared service, sorted.
    [[nodiscard]] std::vector<std::string> declaredServices() const;

    /// @brief Forgets every declaration, instance and listener.
    void reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace aphal::rpc
