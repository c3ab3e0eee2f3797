// /////////////////////////////////////////////////////////////////////////////
/// @file EventLoop.cpp
/// @brief Implementation of the single-threaded event loop.
// /////////////////////////////////////////////////////////////////////////////

#include <aphal/concurrency/EventLoop.hpp>
#include <aphal/core/Log.hpp>

namespace aphal::concurrency {

// -------------------------------------------------------------------------- //
//  Construction / Destruction                                                //
// -------------------------------------------------------------------------- //

EventLoop::EventLoop(std::string name)
    : name_{std::move(name)}
    , queue_{std::make_shared<Queue>()}
{
    worker_ = std::thread(&EventLoop::workerLoop, queue_);
}

EventLoop::~EventLoop()
{
    if (isLoopThread())
    {
        // The worker keeps its own reference to the queue and exits once
        // the remaining tasks have run.
        stopIntake();
        worker_.detach();
        return;
    }
    shutdown();
}

// -------------------------------------------------------------------------- //
//  Lifecycle                                                                 //
// -------------------------------------------------------------------------- //

void EventLoop::shutdown()
{
    stopIntake();

    if (isLoopThread())
    {
        return;
    }

    std::lock_guard<std::mutex> lock{joinMutex_};
    if (worker_.joinable())
    {
        worker_.join();
    }
}

bool EventLoop::isLoopThread() const noexcept
{
    return std::this_thread::get_id() == worker_.get_id();
}

core::usize EventLoop::pending() const
{
    std::lock_guard<std::mutex> lock{queue_->mutex};
    return queue_->tasks.size();
}

// -------------------------------------------------------------------------- //
//  Private                                                                   //
// -------------------------------------------------------------------------- //

void EventLoop::stopIntake()
{
    {
        std::lock_guard<std::mutex> lock{queue_->mutex};
        queue_->stopping = true;
    }
    queue_->cv.notify_all();
}

bool EventLoop::push(std::function<void()> task)
{
    bool accepted = false;
    {
        std::lock_guard<std::mutex> lock{queue_->mutex};
        if (!queue_->stopping)
        {
            queue_->tasks.emplace_back(std::move(task));
            accepted = true;
        }
    }
    if (!accepted)
    {
        core::Log::warn(name_, "task posted after shutdown, dropped");
        return false;
    }
    queue_->cv.notify_one();
    return true;
}

void EventLoop::workerLoop(std::shared_ptr<Queue> queue)
{
    for (;;)
    {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock{queue->mutex};
            queue->cv.wait(lock, [&queue] {
                return queue->stopping || !queue->tasks.empty();
            });

            if (queue->tasks.empty())
            {
                return;
            }

            task = std::move(queue->tasks.front());
            queue->tasks.pop_front();
        }

        task();
    }
}

} // namespace aphal::concurrency
