// /////////////////////////////////////////////////////////////////////////////
/// @file LegacyHostapdBackend.cpp
/// @brief LegacyHostapdBackend implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <aphal/hostapd/LegacyHostapdBackend.hpp>
#include <aphal/hostapd/ApEventRouter.hpp>
#include <aphal/hostapd/ApParams.hpp>
#include <aphal/hostapd/DeathMonitor.hpp>
#include <aphal/rpc/ServiceManager.hpp>
#include <aphal/core/Log.hpp>

namespace aphal::hostapd {

namespace {

constexpr const char* kTag = "LegacyHostapd";

} // namespace

struct LegacyHostapdBackend::Impl
{
    std::shared_ptr<HalContext>            context;
    std::shared_ptr<ApEventRouter>         router;
    DeathMonitor                           monitor;
    std::shared_ptr<ILegacyHostapdService> service;
    LegacyVersion                          version{LegacyVersion::kV1_0};
    std::optional<rpc::ServiceManager::ListenerToken> registration;
    bool                                   closed{false};

    explicit Impl(std::shared_ptr<HalContext> ctx)
        : context{ctx}
        , router{std::make_shared<ApEventRouter>(ctx, kTag)}
        , monitor{ctx, kTag}
    {}

    void stopNotifications()
    {
        if (registration)
        {
            rpc::ServiceManager::instance().unregisterForNotifications(*registration);
            registration.reset();
        }
    }

    /// Runs under the HAL lock, from the death monitor.
    void onServiceDied()
    {
        service.reset();
        router->clear();
        stopNotifications();
    }

    /// Event loop side of a registration notification.
    void onServiceRegistered(const std::shared_ptr<ILegacyHostapdService>& candidate)
    {
        std::lock_guard<std::mutex> lock{context->lock};
        if (closed || !registration)
        {
            return;
        }
        if (!candidate || candidate == service)
        {
            return;
        }
        core::Log::info(kTag, "hostapd service registered");
        auto adopted = adopt(candidate);
        if (!adopted)
        {
            core::Log::error(kTag, "Failed to adopt hostapd service: " + adopted.error().describe());
        }
    }

    core::Expected<void> adopt(std::shared_ptr<ILegacyHostapdService> candidate)
    {
        auto linked = monitor.link(candidate->asBinder(),
                                   [this](core::u64) { onServiceDied(); });
        if (!linked)
        {
            return std::unexpected(std::move(linked.error()));
        }

        const LegacyVersion candidateVersion = candidate->version();
        if (candidateVersion >= LegacyVersion::kV1_1)
        {
            auto registered = check(candidate, candidate->registerCallback(router), "registerCallback");
            if (!registered)
            {
                monitor.unlink();
                return registered;
            }
        }

        service = std::move(candidate);
        version = candidateVersion;
        if (context->verboseLogging)
        {
            core::Log::info(kTag, std::string{"Adopted hostapd "} + std::string{toString(version)});
        }
        applyDebugParams();
        return {};
    }

    void applyDebugParams()
    {
        if (!service || version < LegacyVersion::kV1_2)
            return;
        const DebugLevel level = context->halVerboseLogging ? DebugLevel::kDebug : DebugLevel::kInfo;
        auto result = check(service, service->setDebugParams(level), "setDebugParams");
        if (!result)
        {
            core::Log::warn(kTag, "Debug level not applied: " + result.error().describe());
        }
    }

    /// Maps a status reply onto an error, logging the daemon's message.
    static core::Expected<void> check(const std::shared_ptr<ILegacyHostapdService>& target,
                                      const LegacyStatus& status, const char* method)
    {
        if (status.ok())
        {
            return {};
        }
        core::Log::error(kTag, std::string{method} + " failed: " + status.debugMessage);

        auto binder = target->asBinder();
        if (binder && !binder->isAlive())
        {
            return core::makeError(core::ErrorCode::kRemoteDied, std::string{method} + ": hostapd died");
        }
        return core::makeError(core::ErrorCode::kBackendRejected,
                               std::string{method} + ": " + status.debugMessage);
    }

    core::Expected<void> requireService(const char* method) const
    {
        if (service)
            return {};
        core::Log::error(kTag, std::string{"Cannot call "} + method + ", hostapd service is null");
        return core::makeError(core::ErrorCode::kServiceUnavailable, "hostapd service is null");
    }

    core::Expected<void> requireVersion(LegacyVersion minimum, const char* method) const
    {
        if (version >= minimum)
            return {};
        core::Log::debug(kTag, std::string{method} + " requires hostapd "
                               + std::string{toString(minimum)});
        return core::makeError(core::ErrorCode::kNotSupported,
                               std::string{method} + " not supported by hostapd "
                               + std::string{toString(version)});
    }
};

bool LegacyHostapdBackend::serviceDeclared()
{
    return rpc::ServiceManager::instance().isDeclared(ILegacyHostapdService::kServiceName);
}

LegacyHostapdBackend::LegacyHostapdBackend(std::shared_ptr<HalContext> context)
    : impl_{std::make_shared<Impl>(std::move(context))}
{}

LegacyHostapdBackend::~LegacyHostapdBackend()
{
    impl_->closed = true;
    impl_->stopNotifications();
    impl_->monitor.unlink();
}

const char* LegacyHostapdBackend::name() const noexcept
{
    return "LegacyHostapdBackend";
}

std::optional<LegacyVersion> LegacyHostapdBackend::serviceVersion() const
{
    if (!impl_->service)
        return std::nullopt;
    return impl_->version;
}

// -------------------------------------------------------------------------- //
//  Lifecycle                                                                 //
// -------------------------------------------------------------------------- //

core::Expected<void> LegacyHostapdBackend::initialize()
{
    if (impl_->registration)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "already initialized");
    }

    auto& manager = rpc::ServiceManager::instance();

    // The listener may fire right here on the calling thread, with the HAL
    // lock held, so it only posts.
    std::weak_ptr<Impl> weak = impl_;
    impl_->registration = manager.registerForNotifications(
        ILegacyHostapdService::kServiceName,
        [weak](const std::shared_ptr<rpc::IInterface>& registered) {
            auto self = weak.lock();
            if (!self)
                return;
            auto legacy = std::dynamic_pointer_cast<ILegacyHostapdService>(registered);
            self->context->loop.post([weak, legacy] {
                if (auto target = weak.lock())
                {
                    target->onServiceRegistered(legacy);
                }
            });
        });

    auto running = manager.getService<ILegacyHostapdService>(ILegacyHostapdService::kServiceName);
    if (!running)
    {
        core::Log::info(kTag, "hostapd not running yet, waiting for registration");
        return {};
    }

    auto adopted = impl_->adopt(std::move(running));
    if (!adopted)
    {
        impl_->stopNotifications();
        return adopted;
    }
    return {};
}

void LegacyHostapdBackend::enableVerboseLogging(bool /*verbose*/, bool /*halVerbose*/)
{
    impl_->applyDebugParams();
}

core::Expected<void> LegacyHostapdBackend::startDaemon()
{
    if (impl_->service)
    {
        return {};
    }
    auto running = rpc::ServiceManager::instance().getService<ILegacyHostapdService>(
        ILegacyHostapdService::kServiceName);
    if (!running)
    {
        core::Log::error(kTag, "Failed to start hostapd");
        return core::makeError(core::ErrorCode::kServiceUnavailable, "hostapd service not running");
    }
    return impl_->adopt(std::move(running));
}

bool LegacyHostapdBackend::isInitializationStarted() const
{
    return impl_->registration.has_value();
}

bool LegacyHostapdBackend::isInitializationComplete() const
{
    return impl_->service != nullptr;
}

void LegacyHostapdBackend::terminate() noexcept
{
    impl_->stopNotifications();
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

bool LegacyHostapdBackend::supportsEventCallback() const
{
    return impl_->service && impl_->version >= LegacyVersion::kV1_3;
}

core::Expected<void> LegacyHostapdBackend::registerEventCallback(
    const std::string& ifaceName, std::shared_ptr<ISoftApCallback> callback)
{
    APHAL_TRY_VOID(impl_->requireService("registerEventCallback"));
    APHAL_TRY_VOID(impl_->requireVersion(LegacyVersion::kV1_3, "registerEventCallback"));
    if (!callback)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "null callback");
    }
    impl_->router->setCallback(ifaceName, std::move(callback));
    return {};
}

core::Expected<void> LegacyHostapdBackend::startAccessPoint(
    const std::string& ifaceName, const SoftApConfig& config,
    bool isMetered, FailureListener onFailure)
{
    APHAL_TRY_VOID(impl_->requireService("addAccessPoint"));

    auto ifaceParams   = APHAL_TRY(prepareIfaceParams(ifaceName, config, impl_->context->config));
    auto networkParams = APHAL_TRY(prepareNetworkParams(config, isMetered));

    APHAL_TRY_VOID(Impl::check(impl_->service,
                               impl_->service->addAccessPoint(ifaceParams, networkParams),
                               "addAccessPoint"));

    if (onFailure && impl_->version >= LegacyVersion::kV1_1)
    {
        impl_->router->addFailureListener(ifaceName, std::move(onFailure));
    }
    return {};
}

core::Expected<void> LegacyHostapdBackend::stopAccessPoint(const std::string& ifaceName)
{
    APHAL_TRY_VOID(impl_->requireService("removeAccessPoint"));

    impl_->router->removeInterface(ifaceName);
    return Impl::check(impl_->service, impl_->service->removeAccessPoint(ifaceName),
                       "removeAccessPoint");
}

core::Expected<void> LegacyHostapdBackend::disconnectClient(
    const std::string& ifaceName, const MacAddress& client, DisconnectReason reason)
{
    APHAL_TRY_VOID(impl_->requireService("forceClientDisconnect"));
    APHAL_TRY_VOID(impl_->requireVersion(LegacyVersion::kV1_2, "forceClientDisconnect"));

    return Impl::check(impl_->service,
                       impl_->service->forceClientDisconnect(
                           ifaceName, client, toIeee80211ReasonCode(reason)),
                       "forceClientDisconnect");
}

// -------------------------------------------------------------------------- //
//  Death handling                                                            //
// -------------------------------------------------------------------------- //

core::Expected<void> LegacyHostapdBackend::registerDeathHandler(DeathHandler handler)
{
    if (impl_->monitor.hasHandler())
    {
        core::Log::debug(kTag, "Replacing existing death handler");
    }
    impl_->monitor.setHandler(std::move(handler));
    return {};
}

core::Expected<void> LegacyHostapdBackend::deregisterDeathHandler()
{
    if (!impl_->monitor.hasHandler())
    {
        core::Log::warn(kTag, "No death handler present");
    }
    impl_->monitor.clearHandler();
    return {};
}

void LegacyHostapdBackend::dump(std::ostream& out) const
{
    out << "LegacyHostapdBackend:\n"
        << "  notification registered: " << (impl_->registration ? "true" : "false") << '\n'
        << "  service held: " << (impl_->service ? "true" : "false") << '\n';
    if (impl_->service)
    {
        out << "  version: " << toString(impl_->version) << '\n';
    }
    out << "  death link: " << toString(impl_->monitor.state()) << '\n'
        << "  tracked interfaces: " << impl_->router->interfaceCount() << '\n';
}

} // namespace aphal::hostapd
