// /////////////////////////////////////////////////////////////////////////////
/// @file EventLoop.hpp
/// @brief Single-threaded asynchronous execution context.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <aphal/core/Types.hpp>
#include <aphal/core/NonCopyable.hpp>

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>

namespace aphal::concurrency {

// /////////////////////////////////////////////////////////////////////////////
/// @class EventLoop
/// @brief One worker thread draining a FIFO task queue.
///
/// Asynchronous HAL events (remote death, AP failure, AP info changes,
/// service registration) are posted here so they never run on a caller's
/// thread.  Tasks run strictly in submission order.
///
/// Call @ref shutdown to drain all queued tasks; the destructor calls
/// @c shutdown implicitly and always joins the worker, even when a task
/// already stopped intake.  Tasks posted after shutdown are dropped.
///
/// The queue lives in a block shared with the worker thread, so a loop
/// destroyed from one of its own tasks detaches the worker, which then
/// drains the remaining tasks without touching the destroyed object.
// /////////////////////////////////////////////////////////////////////////////
class EventLoop final : public core::NonCopyable<EventLoop>
{
public:
    /// @param name Thread name shown in logs.
    explicit EventLoop(std::string name = "aphal-events");

    /// @brief Drains pending tasks and joins the worker (detaches it when
    /// called from a loop task).
    ~EventLoop();

    // --------------------------------------------------------------------- //
    //  Task submission                                                       //
    // --------------------------------------------------------------------- //

    /// @brief Posts a fire-and-forget task.
    /// @return false if the loop is already shut down.
    template <typename F>
    bool post(F&& func);

    /// @brief Posts a callable and returns its future.
    /// @tparam F Callable type.
    /// @param func Callable to execute on the loop thread.
    /// @return @c std::future holding the return value.  The future is
    ///         broken (std::future_error on get) if the loop is shut down.
    template <typename F>
    [[nodiscard]] auto enqueue(F&& func) -> std::future<std::invoke_result_t<F>>;

    // --------------------------------------------------------------------- //
    //  Lifecycle                                                             //
    // --------------------------------------------------------------------- //

    /// @brief Stops accepting tasks and blocks until queued tasks are done.
    /// Calling it from the loop thread itself only stops intake.
    void shutdown();

    /// @brief True when called from the worker thread.
    [[nodiscard]] bool isLoopThread() const noexcept;

    /// @brief Number of tasks waiting in the queue.
    [[nodiscard]] core::usize pending() const;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    struct Queue
    {
        std::deque<std::function<void()>> tasks;
        std::mutex                        mutex;
        std::condition_variable           cv;
        bool                              stopping{false};
    };

    bool push(std::function<void()> task);
    void stopIntake();
    static void workerLoop(std::shared_ptr<Queue> queue);

    std::string             name_;
    std::shared_ptr<Queue>  queue_;
    std::thread             worker_;
    std::mutex              joinMutex_;
};

// /////////////////////////////////////////////////////////////////////////////
//  Template implementations                                                  //
// /////////////////////////////////////////////////////////////////////////////

template <typename F>
bool EventLoop::post(F&& func)
{
    return push(std::function<void()>(std::forward<F>(func)));
}

template <typename F>
auto EventLoop::enqueue(F&& func) -> std::future<std::invoke_result_t<F>>
{
    using ReturnType = std::invoke_result_t<F>;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(func));
    std::future<ReturnType> future = task->get_future();

    push([task]() { (*task)(); });
    return future;
}

} // namespace aphal::concurrency
