// /////////////////////////////////////////////////////////////////////////////
/// @file ServiceManager.cpp
/// @brief ServiceManager implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <aphal/rpc/ServiceManager.hpp>
#include <aphal/core/Log.hpp>

#include <map>
#include <mutex>
#include <unordered_map>

namespace aphal::rpc {

namespace {

constexpr std::string_view kTag = "ServiceManager";

struct Registration
{
    std::string             name;
    ServiceManager::Listener listener;
};

} // namespace

struct ServiceManager::Impl
{
    mutable std::mutex                                       mutex;
    std::map<std::string, std::shared_ptr<IInterface>, std::less<>> services;
    std::unordered_map<ListenerToken, Registration>          listeners;
    ListenerToken                                            nextToken{1};
};

ServiceManager& ServiceManager::instance()
{
    static ServiceManager manager;
    return manager;
}

ServiceManager::ServiceManager()
    : impl_{std::make_unique<Impl>()}
{}

ServiceManager::~ServiceManager() = default;

void ServiceManager::declare(std::string_view name)
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    impl_->services.try_emplace(std::string{name}, nullptr);
}

void ServiceManager::addService(std::string_view name, std::shared_ptr<IInterface> service)
{
    std::vector<Listener> toNotify;
    {
        std::lock_guard<std::mutex> lock{impl_->mutex};
        impl_->services.insert_or_assign(std::string{name}, service);
        for (const auto& [token, reg] : impl_->listeners)
        {
            if (reg.name == name)
            {
                toNotify.push_back(reg.listener);
            }
        }
    }

    core::Log::info(kTag, "service registered: " + std::string{name});

    for (const auto& listener : toNotify)
    {
        listener(service);
    }
}

void ServiceManager::removeService(std::string_view name)
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    auto it = impl_->services.find(name);
    if (it != impl_->services.end())
    {
        it->second.reset();
    }
}

bool ServiceManager::isDeclared(std::string_view name) const
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    return impl_->services.find(name) != impl_->services.end();
}

std::shared_ptr<IInterface> ServiceManager::getService(std::string_view name) const
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    auto it = impl_->services.find(name);
    return (it != impl_->services.end()) ? it->second : nullptr;
}

ServiceManager::ListenerToken ServiceManager::registerForNotifications(
    std::string_view name, Listener listener)
{
    std::shared_ptr<IInterface> running;
    ListenerToken token = 0;
    {
        std::lock_guard<std::mutex> lock{impl_->mutex};
        token = impl_->nextToken++;
        impl_->listeners.emplace(token, Registration{std::string{name}, listener});

        auto it = impl_->services.find(name);
        if (it != impl_->services.end())
        {
            running = it->second;
        }
    }

    if (running)
    {
        listener(running);
    }
    return token;
}

void ServiceManager::unregisterForNotifications(ListenerToken token)
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    impl_->listeners.erase(token);
}

std::vector<std::string> ServiceManager::declaredServices() const
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    std::vector<std::string> names;
    names.reserve(impl_->services.size());
    for (const auto& [name, service] : impl_->services)
    {
        names.push_back(name);
    }
    return names;
}

void ServiceManager::reset()
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    impl_->services.clear();
    impl_->listeners.clear();
}

} // namespace aphal::rpc
