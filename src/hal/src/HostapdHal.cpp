// /////////////////////////////////////////////////////////////////////////////
/// @file HostapdHal.cpp
/// @brief HostapdHal implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <aphal/hal/HostapdHal.hpp>
#include <aphal/hostapd/LegacyHostapdBackend.hpp>
#include <aphal/hostapd/ModernHostapdBackend.hpp>
#include <aphal/vendor/VendorHostapd.hpp>
#include <aphal/core/Error.hpp>
#include <aphal/core/Log.hpp>

#include <array>

namespace aphal::hal {

namespace {

constexpr const char* kTag = "HostapdHal";

constexpr std::array<BackendKind, 2> kProviderOrder{BackendKind::kModern, BackendKind::kLegacy};

} // namespace

std::string_view toString(HalState state) noexcept
{
    switch (state)
    {
        case HalState::kUninitialized: return "Uninitialized";
        case HalState::kActive:        return "Active";
        case HalState::kTerminated:    return "Terminated";
    }
    return "?";
}

std::string_view toString(BackendKind kind) noexcept
{
    switch (kind)
    {
        case BackendKind::kModern: return "ModernHostapdBackend";
        case BackendKind::kLegacy: return "LegacyHostapdBackend";
    }
    return "?";
}

struct HostapdHal::Impl
{
    std::shared_ptr<hostapd::HalContext>      context;
    std::unique_ptr<hostapd::IHostapdBackend> backend;
    std::unique_ptr<vendor::VendorHostapd>    vendor;
    HalState                                  state{HalState::kUninitialized};
    hostapd::DeathHandler                     deathHandler;
    core::u64                                 generation{0};

    Impl(concurrency::EventLoop& loop, hostapd::HalConfig config)
        : context{std::make_shared<hostapd::HalContext>(loop, std::move(config))}
    {}

    /// Logs and answers false when there is no backend.  Lock held.
    bool checkBackend(std::string_view method) const
    {
        if (backend)
            return true;
        const core::Error refused{core::ErrorCode::kNotInitialized,
                                  "Cannot call " + std::string{method} + " because the backend is null"};
        core::Log::error(kTag, refused.describe());
        return false;
    }

    /// Collapses a backend result into the facade's bool.
    static bool report(const core::Expected<void>& result, std::string_view method)
    {
        if (result)
            return true;
        if (result.error().code() == core::ErrorCode::kNotSupported)
            core::Log::debug(kTag, std::string{method} + ": " + result.error().describe());
        else
            core::Log::error(kTag, std::string{method} + " failed: " + result.error().describe());
        return false;
    }

    bool vendorActive() const
    {
        return vendor && vendor->isActive();
    }

    /// Drops the backend and the extension.  Lock held.
    void releaseBackend()
    {
        if (vendor)
        {
            vendor->terminate();
            vendor.reset();
        }
        backend.reset();
        deathHandler = nullptr;
        state = HalState::kTerminated;
    }

    hostapd::DeathHandler makeDeathHook(const std::shared_ptr<Impl>& self, core::u64 forGeneration)
    {
        std::weak_ptr<Impl> weak = self;
        return [weak, forGeneration](core::u64 cookie) {
            if (auto impl = weak.lock())
            {
                impl->onBackendDied(forGeneration, cookie);
            }
        };
    }

    /// Event loop, lock not held on entry.
    void onBackendDied(core::u64 forGeneration, core::u64 cookie)
    {
        hostapd::DeathHandler toCall;
        {
            std::lock_guard<std::mutex> lock{context->lock};
            if (!backend || forGeneration != generation)
            {
                core::Log::debug(kTag, "Ignoring death of a superseded backend, cookie="
                                       + std::to_string(cookie));
                return;
            }
            core::Log::error(kTag, "hostapd died, cookie=" + std::to_string(cookie));
            toCall = std::move(deathHandler);
            releaseBackend();
        }

        if (toCall)
        {
            toCall(cookie);
        }
    }

    void negotiateVendor()
    {
        if (!vendor::VendorHostapd::negotiate())
        {
            return;
        }
        auto candidate = std::make_unique<vendor::VendorHostapd>(context);
        auto negotiated = candidate->initialize();
        if (!negotiated)
        {
            core::Log::warn(kTag, "Vendor hostapd unavailable: " + negotiated.error().describe());
            return;
        }
        vendor = std::move(candidate);
    }
};

HostapdHal::HostapdHal(concurrency::EventLoop& loop, hostapd::HalConfig config)
    : impl_{std::make_shared<Impl>(loop, std::move(config))}
{}

HostapdHal::~HostapdHal()
{
    std::lock_guard<std::mutex> lock{impl_->context->lock};
    impl_->vendor.reset();
    impl_->backend.reset();
}

// -------------------------------------------------------------------------- //
//  Provider seams                                                            //
// -------------------------------------------------------------------------- //

bool HostapdHal::isBackendDeclared(BackendKind kind) const
{
    switch (kind)
    {
        case BackendKind::kModern: return hostapd::ModernHostapdBackend::serviceDeclared();
        case BackendKind::kLegacy: return hostapd::LegacyHostapdBackend::serviceDeclared();
    }
    return false;
}

std::unique_ptr<hostapd::IHostapdBackend> HostapdHal::createBackend(
    BackendKind kind, std::shared_ptr<hostapd::HalContext> context)
{
    switch (kind)
    {
        case BackendKind::kModern:
            return std::make_unique<hostapd::ModernHostapdBackend>(std::move(context));
        case BackendKind::kLegacy:
            return std::make_unique<hostapd::LegacyHostapdBackend>(std::move(context));
    }
    return nullptr;
}

// -------------------------------------------------------------------------- //
//  Lifecycle                                                                 //
// -------------------------------------------------------------------------- //

bool HostapdHal::initialize()
{
    std::lock_guard<std::mutex> lock{impl_->context->lock};

    if (impl_->context->verboseLogging)
    {
        core::Log::info(kTag, "Initializing Hostapd Service.");
    }
    if (impl_->backend)
    {
        const core::Error refused{core::ErrorCode::kInvalidState,
                                  "Backend already initialized, terminate it first"};
        core::Log::error(kTag, refused.describe());
        return false;
    }

    std::optional<BackendKind> selected;
    for (BackendKind kind : kProviderOrder)
    {
        if (isBackendDeclared(kind))
        {
            selected = kind;
            break;
        }
    }
    if (!selected)
    {
        const core::Error refused{core::ErrorCode::kNoBackendAvailable,
                                  "No hostapd backend available"};
        core::Log::error(kTag, refused.describe());
        return false;
    }

    core::Log::info(kTag, "Initializing " + std::string{toString(*selected)});
    auto backend = createBackend(*selected, impl_->context);
    if (!backend)
    {
        const core::Error refused{core::ErrorCode::kInternalError,
                                  "Failed to create " + std::string{toString(*selected)}};
        core::Log::error(kTag, refused.describe());
        return false;
    }
    if (!Impl::report(backend->initialize(), "initialize"))
    {
        return false;
    }

    const core::u64 generation = ++impl_->generation;
    if (!Impl::report(backend->registerDeathHandler(impl_->makeDeathHook(impl_, generation)),
                      "registerDeathHandler"))
    {
        backend->terminate();
        return false;
    }
    backend->enableVerboseLogging(impl_->context->verboseLogging,
                                  impl_->context->halVerboseLogging);

    impl_->backend = std::move(backend);
    impl_->state   = HalState::kActive;
    impl_->negotiateVendor();
    return true;
}

void HostapdHal::terminate()
{
    std::lock_guard<std::mutex> lock{impl_->context->lock};
    if (!impl_->checkBackend("terminate"))
    {
        return;
    }
    impl_->backend->terminate();
    impl_->releaseBackend();
}

bool HostapdHal::isInitializationStarted()
{
    std::lock_guard<std::mutex> lock{impl_->context->lock};
    if (!impl_->checkBackend("isInitializationStarted"))
    {
        return false;
    }
    return impl_->backend->isInitializationStarted();
}

bool HostapdHal::isInitializationComplete()
{
    std::lock_guard<std::mutex> lock{impl_->context->lock};
    if (!impl_->checkBackend("isInitializationComplete"))
    {
        return false;
    }
    return impl_->backend->isInitializationComplete();
}

bool HostapdHal::startDaemon()
{
    std::lock_guard<std::mutex> lock{impl_->context->lock};
    if (!impl_->checkBackend("startDaemon"))
    {
        return false;
    }
    return Impl::report(impl_->backend->startDaemon(), "startDaemon");
}

void HostapdHal::enableVerboseLogging(bool verboseEnabled, bool halVerboseEnabled)
{
    std::lock_guard<std::mutex> lock{impl_->context->lock};
    impl_->context->verboseLogging    = verboseEnabled;
    impl_->context->halVerboseLogging = halVerboseEnabled;
    if (impl_->backend)
    {
        impl_->backend->enableVerboseLogging(verboseEnabled, halVerboseEnabled);
    }
}

// -------------------------------------------------------------------------- //
//  Access point control                                                      //
// -------------------------------------------------------------------------- //

bool HostapdHal::supportsEventCallback()
{
    std::lock_guard<std::mutex> lock{impl_->context->lock};
    if (!impl_->checkBackend("supportsEventCallback"))
    {
        return false;
    }
    return impl_->backend->supportsEventCallback() || impl_->vendorActive();
}

bool HostapdHal::registerEventCallback(const std::string& ifaceName,
                                       std::shared_ptr<hostapd::ISoftApCallback> callback)
{
    std::lock_guard<std::mutex> lock{impl_->context->lock};
    if (!impl_->checkBackend("registerEventCallback"))
    {
        return false;
    }

    const bool primary = impl_->backend->supportsEventCallback();
    const bool vendor  = impl_->vendorActive();
    if (!primary && !vendor)
    {
        core::Log::debug(kTag, "registerEventCallback is not supported by "
                               + std::string{impl_->backend->name()});
        return false;
    }

    if (vendor)
    {
        impl_->vendor->registerEventCallback(ifaceName, callback);
    }
    if (primary)
    {
        return Impl::report(impl_->backend->registerEventCallback(ifaceName, std::move(callback)),
                            "registerEventCallback");
    }
    return true;
}

bool HostapdHal::startAccessPoint(const std::string& ifaceName, const hostapd::SoftApConfig& config,
                                  bool isMetered, hostapd::FailureListener onFailure)
{
    std::lock_guard<std::mutex> lock{impl_->context->lock};
    if (!impl_->checkBackend("addAccessPoint"))
    {
        return false;
    }
    return Impl::report(
        impl_->backend->startAccessPoint(ifaceName, config, isMetered, std::move(onFailure)),
        "addAccessPoint");
}

bool HostapdHal::stopAccessPoint(const std::string& ifaceName)
{
    std::lock_guard<std::mutex> lock{impl_->context->lock};
    if (!impl_->checkBackend("removeAccessPoint"))
    {
        return false;
    }
    if (impl_->vendor)
    {
        impl_->vendor->removeInterface(ifaceName);
    }
    return Impl::report(impl_->backend->stopAccessPoint(ifaceName), "removeAccessPoint");
}

bool HostapdHal::disconnectClient(const std::string& ifaceName, const hostapd::MacAddress& client,
                                  hostapd::DisconnectReason reason)
{
    std::lock_guard<std::mutex> lock{impl_->context->lock};
    if (!impl_->checkBackend("forceClientDisconnect"))
    {
        return false;
    }
    return Impl::report(impl_->backend->disconnectClient(ifaceName, client, reason),
                        "forceClientDisconnect");
}

// -------------------------------------------------------------------------- //
//  Death                                                                     //
// -------------------------------------------------------------------------- //

bool HostapdHal::registerDeathHandler(hostapd::DeathHandler handler)
{
    std::lock_guard<std::mutex> lock{impl_->context->lock};
    if (!impl_->checkBackend("registerDeathHandler"))
    {
        return false;
    }
    if (impl_->deathHandler)
    {
        core::Log::debug(kTag, "Replacing death handler");
    }
    impl_->deathHandler = std::move(handler);
    return Impl::report(
        impl_->backend->registerDeathHandler(impl_->makeDeathHook(impl_, impl_->generation)),
        "registerDeathHandler");
}

bool HostapdHal::deregisterDeathHandler()
{
    std::lock_guard<std::mutex> lock{impl_->context->lock};
    if (!impl_->checkBackend("deregisterDeathHandler"))
    {
        return false;
    }
    if (!impl_->deathHandler)
    {
        core::Log::warn(kTag, "No death handler registered");
    }
    // The backend keeps the facade's own hook so that a death still tears
    // the backend down.
    impl_->deathHandler = nullptr;
    return true;
}

// -------------------------------------------------------------------------- //
//  Vendor extension                                                          //
// -------------------------------------------------------------------------- //

bool HostapdHal::useVendorHostapdHal()
{
    std::lock_guard<std::mutex> lock{impl_->context->lock};
    return impl_->backend && impl_->vendorActive();
}

std::optional<vendor::VendorVersion> HostapdHal::vendorVersion()
{
    std::lock_guard<std::mutex> lock{impl_->context->lock};
    if (!impl_->backend || !impl_->vendorActive())
    {
        return std::nullopt;
    }
    return impl_->vendor->version();
}

bool HostapdHal::startVendorAccessPoint(const std::string& ifaceName,
                                        const hostapd::SoftApConfig& config,
                                        hostapd::FailureListener onFailure)
{
    std::lock_guard<std::mutex> lock{impl_->context->lock};
    if (!impl_->checkBackend("addVendorAccessPoint"))
    {
        return false;
    }
    if (!impl_->vendorActive())
    {
        core::Log::debug(kTag, "addVendorAccessPoint: vendor hostapd is not in use");
        return false;
    }
    return Impl::report(
        impl_->vendor->startAccessPoint(ifaceName, config, false, std::move(onFailure)),
        "addVendorAccessPoint");
}

// -------------------------------------------------------------------------- //
//  Diagnostics                                                               //
// -------------------------------------------------------------------------- //

HalState HostapdHal::state() const
{
    std::lock_guard<std::mutex> lock{impl_->context->lock};
    return impl_->state;
}

void HostapdHal::dump(std::ostream& out)
{
    std::lock_guard<std::mutex> lock{impl_->context->lock};

    out << "Dump of HostapdHal\n"
        << "  backend: " << (impl_->backend ? impl_->backend->name() : "null") << '\n';
    for (BackendKind kind : kProviderOrder)
    {
        out << "  " << toString(kind) << " declared: "
            << (isBackendDeclared(kind) ? "true" : "false") << '\n';
    }
    out << "  initialized: " << (impl_->backend ? "true" : "false") << '\n'
        << "  state: " << toString(impl_->state) << '\n'
        << "  vendor version: ";
    if (impl_->vendorActive())
        out << vendor::toString(*impl_->vendor->version()) << '\n';
    else
        out << "none\n";

    if (impl_->backend)
    {
        impl_->backend->dump(out);
    }
    if (impl_->vendor)
    {
        impl_->vendor->dump(out);
    }
}

} // namespace aphal::hal
