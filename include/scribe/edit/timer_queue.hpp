#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace scribe::edit
{

using TimerId = std::uint64_t;
inline constexpr TimerId kInvalidTimer = 0;

// Single-threaded timer list. Due tasks only run when the owner calls runDue(),
// which the UI does from its idle loop.
class TimerQueue
{
public:
    using Clock = std::chrono::steady_clock;
    using NowFunction = std::function<Clock::time_point()>;

    TimerQueue();
    explicit TimerQueue(NowFunction nowFunction);

    TimerQueue(const TimerQueue &) = delete;
    TimerQueue &operator=(const TimerQueue &) = delete;

    TimerId schedule(Clock::duration delay, std::function<void()> task);
    bool cancel(TimerId id) noexcept;
    bool isPending(TimerId id) const noexcept;
    std::size_t pendingCount() const noexcept { return timers.size(); }
    std::optional<Clock::time_point> nextDeadline() const;

    // Runs every timer whose deadline has passed; returns the number run.
    std::size_t runDue();

    Clock::time_point now() const { return nowFunction(); }

private:
    struct Entry
    {
        TimerId id = kInvalidTimer;
        Clock::time_point deadline;
        std::function<void()> task;
    };

    NowFunction nowFunction;
    std::vector<Entry> timers;
    TimerId nextId = 1;
};

// Owned single-shot timer. Arming replaces any pending shot; destruction cancels it.
class PendingTimer
{
public:
    explicit PendingTimer(TimerQueue &queue) noexcept;
    ~PendingTimer();

    PendingTimer(const PendingTimer &) = delete;
    PendingTimer &operator=(const PendingTimer &) = delete;

    void arm(TimerQueue::Clock::duration delay, std::function<void()> task);
    void cancel() noexcept;
    bool isArmed() const noexcept;

private:
    TimerQueue &queue;
    TimerId id = kInvalidTimer;
};

} // namespace scribe::edit
