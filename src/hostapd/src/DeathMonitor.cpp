// /////////////////////////////////////////////////////////////////////////////
/// @file DeathMonitor.cpp
/// @brief DeathMonitor implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <aphal/hostapd/DeathMonitor.hpp>
#include <aphal/core/Log.hpp>

#include <atomic>

namespace aphal::hostapd {

namespace {

std::atomic<core::u64> gNextCookie{1};

} // namespace

struct DeathMonitor::Shared final : rpc::DeathRecipient,
                                    std::enable_shared_from_this<Shared>
{
    std::shared_ptr<HalContext> context;
    std::string                 tag;

    // Written under the HAL lock; atomic so that accessors may peek.
    std::atomic<State>     state{State::kIdle};
    std::atomic<core::u64> cookie{0};

    // Guarded by the HAL lock.
    std::shared_ptr<rpc::IBinder> binder;
    Teardown                      teardown;
    DeathHandler                  handler;

    Shared(std::shared_ptr<HalContext> ctx, std::string t)
        : context{std::move(ctx)}, tag{std::move(t)}
    {}

    void binderDied(core::u64 deadCookie) override
    {
        // Transport thread: hand off to the event loop, touch nothing here.
        std::weak_ptr<Shared> weak = weak_from_this();
        context->loop.post([weak, deadCookie] {
            if (auto self = weak.lock())
            {
                self->onDied(deadCookie);
            }
        });
    }

    void onDied(core::u64 deadCookie)
    {
        DeathHandler toCall;
        {
            std::lock_guard<std::mutex> lock{context->lock};

            if (state.load() != State::kLinked || cookie.load() != deadCookie)
            {
                core::Log::debug(tag, "Ignoring stale death notification, cookie="
                                      + std::to_string(deadCookie));
                return;
            }

            core::Log::warn(tag, "Remote died: cookie=" + std::to_string(deadCookie));
            state.store(State::kDied);
            binder.reset();

            if (teardown)
            {
                teardown(deadCookie);
            }
            toCall = handler;
        }

        if (toCall)
        {
            toCall(deadCookie);
        }
    }

    void detach()
    {
        if (binder)
        {
            binder->unlinkToDeath(this);
            binder.reset();
        }
        teardown = nullptr;
    }
};

DeathMonitor::DeathMonitor(std::shared_ptr<HalContext> context, std::string tag)
    : shared_{std::make_shared<Shared>(std::move(context), std::move(tag))}
{}

DeathMonitor::~DeathMonitor()
{
    unlink();
}

core::Expected<core::u64> DeathMonitor::link(
    std::shared_ptr<rpc::IBinder> binder, Teardown teardown)
{
    if (!binder)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "null binder");
    }

    unlink();

    const core::u64 newCookie = gNextCookie.fetch_add(1);
    auto linked = binder->linkToDeath(shared_, newCookie);
    if (!linked)
    {
        core::Log::error(shared_->tag, "Error on linkToDeath: " + linked.error().describe());
        return std::unexpected(std::move(linked.error()));
    }

    shared_->binder   = std::move(binder);
    shared_->teardown = std::move(teardown);
    shared_->cookie.store(newCookie);
    shared_->state.store(State::kLinked);
    return newCookie;
}

void DeathMonitor::unlink()
{
    if (shared_->state.load() != State::kLinked)
    {
        return;
    }
    shared_->detach();
    shared_->state.store(State::kUnlinked);
}

void DeathMonitor::setHandler(DeathHandler handler)
{
    shared_->handler = std::move(handler);
}

void DeathMonitor::clearHandler()
{
    shared_->handler = nullptr;
}

bool DeathMonitor::hasHandler() const noexcept
{
    return static_cast<bool>(shared_->handler);
}

DeathMonitor::State DeathMonitor::state() const noexcept
{
    return shared_->state.load();
}

core::u64 DeathMonitor::cookie() const noexcept
{
    return shared_->cookie.load();
}

std::string_view toString(DeathMonitor::State state) noexcept
{
    switch (state)
    {
        case DeathMonitor::State::kIdle:     return "Idle";
        case DeathMonitor::State::kLinked:   return "Linked";
        case DeathMonitor::State::kDied:     return "Died";
        case DeathMonitor::State::kUnlinked: return "Unlinked";
    }
    return "?";
}

} // namespace aphal::hostapd
