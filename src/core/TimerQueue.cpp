// SPDX-License-Identifier: Apache-2.0
#include "TimerQueue.hpp"

#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace toolbridge
{

struct TimerQueue::Impl
{
    using Clock = std::chrono::steady_clock;

    struct Entry
    {
        Clock::time_point deadline;
        Task task;
    };

    mutable std::mutex mutex;
    std::condition_variable_any cv;
    std::map<TimerId, Entry> entries;
    TimerId nextId = 1;
    std::jthread worker;

    /// @brief Returns the id of the entry with the earliest deadline. Requires a non-empty queue.
    [[nodiscard]] auto earliest() const -> std::map<TimerId, Entry>::const_iterator
    {
        auto best = entries.begin();
        for (auto it = std::next(entries.begin()); it != entries.end(); ++it)
        {
            if (it->second.deadline < best->second.deadline)
                best = it;
        }
        return best;
    }

    void run(const std::stop_token& stopToken)
    {
        while (!stopToken.stop_requested())
        {
            auto task = Task {};
            {
                auto lock = std::unique_lock(mutex);
                if (entries.empty())
                {
                    cv.wait(lock, stopToken, [this] { return !entries.empty(); });
                    continue;
                }

                auto const next = earliest();
                auto const deadline = next->second.deadline;
                auto const nextId = next->first;
                if (Clock::now() < deadline)
                {
                    // Wake early when an entry is added, cancelled or the queue shuts down.
                    cv.wait_until(lock, stopToken, deadline, [this, nextId, deadline] {
                        auto const it = entries.find(nextId);
                        return it == entries.end() || earliest()->second.deadline < deadline;
                    });
                    continue;
                }

                task = std::move(entries.at(nextId).task);
                entries.erase(nextId);
            }

            if (task)
                task();
        }
    }
};

TimerQueue::TimerQueue(): _impl(std::make_unique<Impl>())
{
    _impl->worker = std::jthread([this](const std::stop_token& token) { _impl->run(token); });
}

TimerQueue::~TimerQueue()
{
    shutdown();
}

auto TimerQueue::schedule(std::chrono::milliseconds delay, Task task) -> TimerId
{
    auto const lock = std::lock_guard(_impl->mutex);
    auto const id = _impl->nextId++;
    _impl->entries.emplace(id, Impl::Entry { .deadline = Impl::Clock::now() + delay, .task = std::move(task) });
    _impl->cv.notify_all();
    return id;
}

auto TimerQueue::cancel(TimerId id) -> bool
{
    auto const lock = std::lock_guard(_impl->mutex);
    auto const removed = _impl->entries.erase(id) > 0;
    if (removed)
        _impl->cv.notify_all();
    return removed;
}

auto TimerQueue::pendingCount() const -> std::size_t
{
    auto const lock = std::lock_guard(_impl->mutex);
    return _impl->entries.size();
}

void TimerQueue::shutdown()
{
    // Dropped tasks are destroyed after the lock is released; their captures may own resources
    // whose destructors schedule or cancel on this queue.
    auto dropped = std::map<TimerId, Impl::Entry> {};
    {
        auto const lock = std::lock_guard(_impl->mutex);
        dropped.swap(_impl->entries);
    }

    if (_impl->worker.joinable())
    {
        _impl->worker.request_stop();
        _impl->worker.join();
    }

    dropped.clear();
    {
        auto const lock = std::lock_guard(_impl->mutex);
        dropped.swap(_impl->entries);
    }
}

} // namespace toolbridge
