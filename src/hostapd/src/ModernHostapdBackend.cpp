// /////////////////////////////////////////////////////////////////////////////
/// @file ModernHostapdBackend.cpp
/// @brief ModernHostapdBackend implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <aphal/hostapd/ModernHostapdBackend.hpp>
#include <aphal/hostapd/ApEventRouter.hpp>
#include <aphal/hostapd/ApParams.hpp>
#include <aphal/hostapd/DeathMonitor.hpp>
#include <aphal/hostapd/IHostapdService.hpp>
#include <aphal/rpc/ServiceManager.hpp>
#include <aphal/core/Log.hpp>

namespace aphal::hostapd {

namespace {

constexpr const char* kTag = "ModernHostapd";

} // namespace

struct ModernHostapdBackend::Impl
{
    std::shared_ptr<HalContext>      context;
    std::shared_ptr<ApEventRouter>   router;
    DeathMonitor                     monitor;
    std::shared_ptr<IHostapdService> service;

    explicit Impl(std::shared_ptr<HalContext> ctx)
        : context{ctx}
        , router{std::make_shared<ApEventRouter>(ctx, kTag)}
        , monitor{ctx, kTag}
    {}

    /// Runs under the HAL lock, from the death monitor.
    void onServiceDied()
    {
        service.reset();
        router->clear();
    }

    core::Expected<void> adopt(std::shared_ptr<IHostapdService> candidate)
    {
        auto linked = monitor.link(candidate->asBinder(),
                                   [this](core::u64) { onServiceDied(); });
        if (!linked)
        {
            return std::unexpected(std::move(linked.error()));
        }

        auto registered = candidate->registerCallback(router);
        if (!registered)
        {
            core::Log::error(kTag, "registerCallback failed: " + registered.error().describe());
            monitor.unlink();
            return registered;
        }

        service = std::move(candidate);
        applyDebugParams();
        return {};
    }

    void applyDebugParams()
    {
        if (!service)
            return;
        const DebugLevel level = context->halVerboseLogging ? DebugLevel::kDebug : DebugLevel::kInfo;
        auto result = service->setDebugParams(level);
        if (!result)
        {
            core::Log::error(kTag, "setDebugParams failed: " + result.error().describe());
        }
    }

    core::Expected<void> requireService(const char* method) const
    {
        if (service)
            return {};
        core::Log::error(kTag, std::string{"Cannot call "} + method + ", hostapd service is null");
        return core::makeError(core::ErrorCode::kServiceUnavailable, "hostapd service is null");
    }
};

bool ModernHostapdBackend::serviceDeclared()
{
    return rpc::ServiceManager::instance().isDeclared(IHostapdService::kServiceName);
}

ModernHostapdBackend::ModernHostapdBackend(std::shared_ptr<HalContext> context)
    : impl_{std::make_unique<Impl>(std::move(context))}
{}

ModernHostapdBackend::~ModernHostapdBackend() = default;

const char* ModernHostapdBackend::name() const noexcept
{
    return "ModernHostapdBackend";
}

// -------------------------------------------------------------------------- //
//  Lifecycle                                                                 //
// -------------------------------------------------------------------------- //

core::Expected<void> ModernHostapdBackend::initialize()
{
    if (impl_->context->verboseLogging)
    {
        core::Log::info(kTag, "Initializing hostapd service.");
    }

    auto service = rpc::ServiceManager::instance().getService<IHostapdService>(
        IHostapdService::kServiceName);
    if (!service)
    {
        core::Log::error(kTag, "Failed to get hostapd service");
        return core::makeError(core::ErrorCode::kServiceUnavailable, "hostapd service not running");
    }

    auto adopted = impl_->adopt(std::move(service));
    if (!adopted)
    {
        return adopted;
    }
    core::Log::info(kTag, "hostapd service initialized");
    return {};
}

void ModernHostapdBackend::enableVerboseLogging(bool /*verbose*/, bool /*halVerbose*/)
{
    // The flags themselves live in the shared context.
    impl_->applyDebugParams();
}

core::Expected<void> ModernHostapdBackend::startDaemon()
{
    if (impl_->service)
    {
        return {};
    }

    auto service = rpc::ServiceManager::instance().getService<IHostapdService>(
        IHostapdService::kServiceName);
    if (!service)
    {
        core::Log::error(kTag, "Failed to start hostapd");
        return core::makeError(core::ErrorCode::kServiceUnavailable, "hostapd service not running");
    }
    return impl_->adopt(std::move(service));
}

bool ModernHostapdBackend::isInitializationStarted() const
{
    return impl_->service != nullptr;
}

bool ModernHostapdBackend::isInitializationComplete() const
{
    return impl_->service != nullptr;
}

void ModernHostapdBackend::terminate() noexcept
{
    impl_->monitor.unlink();
    if (impl_->service)
    {
        core::Log::info(kTag, "Terminating hostapd");
        impl_->service->terminate();
        impl_->service.reset();
    }
    impl_->router->clear();
}

// -------------------------------------------------------------------------- //
//  Access point control                                                      //
// -------------------------------------------------------------------------- //

bool ModernHostapdBackend::supportsEventCallback() const
{
    return true;
}

core::Expected<void> ModernHostapdBackend::registerEventCallback(
    const std::string& ifaceName, std::shared_ptr<ISoftApCallback> callback)
{
    APHAL_TRY_VOID(impl_->requireService("registerEventCallback"));
    if (!callback)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "null callback");
    }
    impl_->router->setCallback(ifaceName, std::move(callback));
    return {};
}

core::Expected<void> ModernHostapdBackend::startAccessPoint(
    const std::string& ifaceName, const SoftApConfig& config,
    bool isMetered, FailureListener onFailure)
{
    APHAL_TRY_VOID(impl_->requireService("addAccessPoint"));

    auto ifaceParams   = APHAL_TRY(prepareIfaceParams(ifaceName, config, impl_->context->config));
    auto networkParams = APHAL_TRY(prepareNetworkParams(config, isMetered));

    auto added = impl_->service->addAccessPoint(ifaceParams, networkParams);
    if (!added)
    {
        core::Log::error(kTag, "addAccessPoint failed on " + ifaceName + ": "
                               + added.error().describe());
        return added;
    }

    if (onFailure)
    {
        impl_->router->addFailureListener(ifaceName, std::move(onFailure));
    }
    return {};
}

core::Expected<void> ModernHostapdBackend::stopAccessPoint(const std::string& ifaceName)
{
    APHAL_TRY_VOID(impl_->requireService("removeAccessPoint"));

    impl_->router->removeInterface(ifaceName);
    auto removed = impl_->service->removeAccessPoint(ifaceName);
    if (!removed)
    {
        core::Log::error(kTag, "removeAccessPoint failed on " + ifaceName + ": "
                               + removed.error().describe());
    }
    return removed;
}

core::Expected<void> ModernHostapdBackend::disconnectClient(
    const std::string& ifaceName, const MacAddress& client, DisconnectReason reason)
{
    APHAL_TRY_VOID(impl_->requireService("forceClientDisconnect"));

    auto result = impl_->service->forceClientDisconnect(
        ifaceName, client, toIeee80211ReasonCode(reason));
    if (!result)
    {
        core::Log::error(kTag, "forceClientDisconnect failed for " + client.toString() + ": "
                               + result.error().describe());
    }
    return result;
}

// -------------------------------------------------------------------------- //
//  Death handling                                                            //
// -------------------------------------------------------------------------- //

core::Expected<void> ModernHostapdBackend::registerDeathHandler(DeathHandler handler)
{
    if (impl_->monitor.hasHandler())
    {
        core::Log::debug(kTag, "Replacing existing death handler");
    }
    impl_->monitor.setHandler(std::move(handler));
    return {};
}

core::Expected<void> ModernHostapdBackend::deregisterDeathHandler()
{
    if (!impl_->monitor.hasHandler())
    {
        core::Log::warn(kTag, "No death handler present");
    }
    impl_->monitor.clearHandler();
    return {};
}

void ModernHostapdBackend::dump(std::ostream& out) const
{
    out << "ModernHostapdBackend:\n"
        << "  service held: " << (impl_->service ? "true" : "false") << '\n'
        << "  death link: " << toString(impl_->monitor.state()) << '\n'
        << "  tracked interfaces: " << impl_->router->interfaceCount() << '\n';
}

} // namespace aphal::hostapd
