// /////////////////////////////////////////////////////////////////////////////
/// @file ApEventRouter.cpp
/// @brief ApEventRouter implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <aphal/hostapd/ApEventRouter.hpp>
#include <aphal/core/Log.hpp>

namespace aphal::hostapd {

ApEventRouter::ApEventRouter(std::shared_ptr<HalContext> context, std::string tag)
    : context_{std::move(context)}
    , tag_{std::move(tag)}
{}

// -------------------------------------------------------------------------- //
//  Registration (HAL lock held)                                              //
// -------------------------------------------------------------------------- //

void ApEventRouter::addFailureListener(const std::string& ifaceName, FailureListener listener)
{
    failureListeners_.insert_or_assign(ifaceName, std::move(listener));
}

void ApEventRouter::setCallback(const std::string& ifaceName,
                                std::shared_ptr<ISoftApCallback> callback)
{
    callbacks_.insert_or_assign(ifaceName, std::move(callback));
}

void ApEventRouter::removeInterface(const std::string& ifaceName)
{
    failureListeners_.erase(ifaceName);
    callbacks_.erase(ifaceName);
}

void ApEventRouter::clear()
{
    failureListeners_.clear();
    callbacks_.clear();
}

bool ApEventRouter::hasFailureListener(const std::string& ifaceName) const
{
    return failureListeners_.contains(ifaceName);
}

bool ApEventRouter::hasCallback(const std::string& ifaceName) const
{
    return callbacks_.contains(ifaceName);
}

core::usize ApEventRouter::interfaceCount() const
{
    return failureListeners_.size();
}

// -------------------------------------------------------------------------- //
//  Daemon events (transport thread)                                          //
// -------------------------------------------------------------------------- //

void ApEventRouter::onFailure(const std::string& ifaceName, const std::string& instanceName)
{
    core::Log::warn(tag_, "Failure on iface " + ifaceName + ", instance " + instanceName);

    std::weak_ptr<ApEventRouter> weak = weak_from_this();
    context_->loop.post([weak, ifaceName, instanceName] {
        if (auto self = weak.lock())
        {
            self->dispatchFailure(ifaceName, instanceName);
        }
    });
}

void ApEventRouter::onApInstanceInfoChanged(const ApInfo& info)
{
    std::weak_ptr<ApEventRouter> weak = weak_from_this();
    context_->loop.post([weak, info] {
        auto self = weak.lock();
        if (!self)
            return;
        if (auto callback = self->callbackFor(info.ifaceName))
            callback->onInfoChanged(info);
    });
}

void ApEventRouter::onConnectedClientsChanged(const ClientInfo& client)
{
    std::weak_ptr<ApEventRouter> weak = weak_from_this();
    context_->loop.post([weak, client] {
        auto self = weak.lock();
        if (!self)
            return;
        if (auto callback = self->callbackFor(client.ifaceName))
            callback->onConnectedClientsChanged(client);
    });
}

// -------------------------------------------------------------------------- //
//  Event loop side                                                           //
// -------------------------------------------------------------------------- //

void ApEventRouter::dispatchFailure(const std::string& ifaceName, const std::string& instanceName)
{
    FailureListener                  listener;
    std::shared_ptr<ISoftApCallback> callback;
    const bool wholeAp = instanceName.empty() || instanceName == ifaceName;
    {
        std::lock_guard<std::mutex> lock{context_->lock};

        auto cb = callbacks_.find(ifaceName);
        if (cb != callbacks_.end())
            callback = cb->second;

        if (wholeAp)
        {
            auto it = failureListeners_.find(ifaceName);
            if (it != failureListeners_.end())
            {
                listener = std::move(it->second);
                failureListeners_.erase(it);
            }
        }
    }

    if (!wholeAp)
    {
        if (callback)
            callback->onInstanceFailure(instanceName);
        return;
    }

    if (!listener && !callback)
    {
        core::Log::debug(tag_, "No listener for failed iface " + ifaceName);
        return;
    }
    if (listener)
        listener();
    if (callback)
        callback->onFailure();
}

std::shared_ptr<ISoftApCallback> ApEventRouter::callbackFor(const std::string& ifaceName)
{
    std::lock_guard<std::mutex> lock{context_->lock};
    auto it = callbacks_.find(ifaceName);
    if (it == callbacks_.end())
    {
        core::Log::debug(tag_, "No event callback for iface " + ifaceName);
        return nullptr;
    }
    return it->second;
}

} // namespace aphal::hostapd
