// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

namespace toolbridge
{

/// @brief Runs cancellable one-shot tasks after a delay on a dedicated worker thread.
///
/// Tasks are executed outside the queue's internal lock, so a task may schedule or cancel
/// other tasks on the same queue. Tasks due at the same instant run in scheduling order.
class TimerQueue
{
  public:
    using TimerId = std::uint64_t;
    using Task = std::function<void()>;

    TimerQueue();
    ~TimerQueue();

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    /// @brief Schedules a task to run once after the given delay.
    /// @param delay Time to wait before running the task.
    /// @param task The task to run.
    /// @return A handle that can be passed to cancel().
    auto schedule(std::chrono::milliseconds delay, Task task) -> TimerId;

    /// @brief Cancels a scheduled task.
    /// @param id The handle returned by schedule().
    /// @return True if the task was removed before it started running.
    auto cancel(TimerId id) -> bool;

    /// @brief Returns the number of tasks waiting to run.
    [[nodiscard]] auto pendingCount() const -> std::size_t;

    /// @brief Drops all pending tasks and joins the worker thread. Idempotent.
    ///
    /// Dropped tasks are destroyed on the calling thread without running. Tasks scheduled
    /// afterwards never run. Must not be called from within a task.
    void shutdown();

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolbridge
