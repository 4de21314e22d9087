#include "scribe/edit/timer_queue.hpp"

#include <algorithm>
#include <utility>

namespace scribe::edit
{

TimerQueue::TimerQueue()
    : nowFunction([] { return Clock::now(); })
{
}

TimerQueue::TimerQueue(NowFunction function)
    : nowFunction(function ? std::move(function) : NowFunction([] { return Clock::now(); }))
{
}

TimerId TimerQueue::schedule(Clock::duration delay, std::function<void()> task)
{
    Entry entry;
    entry.id = nextId++;
    entry.deadline = nowFunction() + std::max(delay, Clock::duration::zero());
    entry.task = std::move(task);
    timers.push_back(std::move(entry));
    return timers.back().id;
}

bool TimerQueue::cancel(TimerId id) noexcept
{
    auto it = std::find_if(timers.begin(), timers.end(), [&](const Entry &entry) { return entry.id == id; });
    if (it == timers.end())
        return false;
    timers.erase(it);
    return true;
}

bool TimerQueue::isPending(TimerId id) const noexcept
{
    return std::any_of(timers.begin(), timers.end(), [&](const Entry &entry) { return entry.id == id; });
}

std::optional<TimerQueue::Clock::time_point> TimerQueue::nextDeadline() const
{
    if (timers.empty())
        return std::nullopt;
    auto it = std::min_element(timers.begin(), timers.end(), [](const Entry &a, const Entry &b) {
        return a.deadline < b.deadline;
    });
    return it->deadline;
}

std::size_t TimerQueue::runDue()
{
    const Clock::time_point current = nowFunction();
    std::size_t ran = 0;
    while (true)
    {
        // Earliest due entry; ties keep scheduling order because ids only grow.
        auto due = timers.end();
        for (auto it = timers.begin(); it != timers.end(); ++it)
        {
            if (it->deadline > current)
                continue;
            if (due == timers.end() || it->deadline < due->deadline)
                due = it;
        }
        if (due == timers.end())
            break;

        // A task may schedule or cancel other timers, so detach it first.
        std::function<void()> task = std::move(due->task);
        timers.erase(due);
        if (task)
            task();
        ++ran;
    }
    return ran;
}

PendingTimer::PendingTimer(TimerQueue &owner) noexcept
    : queue(owner)
{
}

PendingTimer::~PendingTimer()
{
    cancel();
}

void PendingTimer::arm(TimerQueue::Clock::duration delay, std::function<void()> task)
{
    cancel();
    // Clear the id before the task runs so isArmed() is false inside it.
    id = queue.schedule(delay, [this, task = std::move(task)]() {
        id = kInvalidTimer;
        if (task)
            task();
    });
}

void PendingTimer::cancel() noexcept
{
    if (id == kInvalidTimer)
        return;
    queue.cancel(id);
    id = kInvalidTimer;
}

bool PendingTimer::isArmed() const noexcept
{
    return id != kInvalidTimer && queue.isPending(id);
}

} // namespace scribe::edit
