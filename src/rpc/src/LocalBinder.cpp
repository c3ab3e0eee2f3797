// /////////////////////////////////////////////////////////////////////////////
/// @file LocalBinder.cpp
/// @brief LocalBinder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <aphal/rpc/LocalBinder.hpp>
#include <aphal/core/Log.hpp>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <vector>

namespace aphal::rpc {

namespace {

struct Link
{
    std::weak_ptr<DeathRecipient> recipient;
    const DeathRecipient*         key;
    core::u64                     cookie;
};

} // namespace

struct LocalBinder::Impl
{
    std::string       descriptor;
    std::atomic<bool> alive{true};
    mutable std::mutex mutex;
    std::vector<Link> links;

    explicit Impl(std::string desc) : descriptor{std::move(desc)} {}
};

LocalBinder::LocalBinder(std::string descriptor)
    : impl_{std::make_unique<Impl>(std::move(descriptor))}
{}

LocalBinder::~LocalBinder() = default;

bool LocalBinder::isAlive() const noexcept
{
    return impl_->alive.load(std::memory_order_acquire);
}

core::Expected<void> LocalBinder::linkToDeath(
    std::weak_ptr<DeathRecipient> recipient, core::u64 cookie)
{
    const auto locked = recipient.lock();
    if (!locked)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "null death recipient");
    }

    std::lock_guard<std::mutex> lock{impl_->mutex};
    if (!isAlive())
    {
        return core::makeError(core::ErrorCode::kRemoteDied,
                               impl_->descriptor + " is already dead");
    }
    impl_->links.push_back(Link{std::move(recipient), locked.get(), cookie});
    return {};
}

bool LocalBinder::unlinkToDeath(const DeathRecipient* recipient)
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    const auto before = impl_->links.size();
    std::erase_if(impl_->links, [recipient](const Link& l) { return l.key == recipient; });
    return impl_->links.size() != before;
}

std::string_view LocalBinder::descriptor() const noexcept
{
    return impl_->descriptor;
}

void LocalBinder::kill()
{
    std::vector<Link> links;
    {
        std::lock_guard<std::mutex> lock{impl_->mutex};
        if (!impl_->alive.exchange(false, std::memory_order_acq_rel))
        {
            return;
        }
        links.swap(impl_->links);
    }

    core::Log::warn("LocalBinder", impl_->descriptor + " died");

    // Delivered outside the lock: recipients may unlink or relink elsewhere.
    for (const auto& link : links)
    {
        if (auto recipient = link.recipient.lock())
        {
            recipient->binderDied(link.cookie);
        }
    }
}

core::usize LocalBinder::linkCount() const
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    return impl_->links.size();
}

} // namespace aphal::rpc
