#include "event_loop.hpp"

#include <algorithm>

EventLoop::TimerId EventLoop::schedule(Duration delay, Task task) {
    const TimerId id = m_next_id++;
    const auto deadline =
        m_now + std::chrono::duration_cast<Clock::duration>(delay);
    m_timers.push_back(Timer{id, deadline, std::move(task)});
    return id;
}

bool EventLoop::cancel(TimerId id) {
    if (id == kInvalidTimer)
        return false;
    auto it = std::find_if(m_timers.begin(), m_timers.end(),
                           [id](const Timer &t) { return t.id == id; });
    if (it == m_timers.end())
        return false;
    m_timers.erase(it);
    return true;
}

bool EventLoop::is_pending(TimerId id) const {
    return std::any_of(m_timers.begin(), m_timers.end(),
                       [id](const Timer &t) { return t.id == id; });
}

std::size_t EventLoop::run_due(TimePoint now) {
    if (now > m_now)
        m_now = now;

    std::size_t executed = 0;

    // Snapshot of due timers; anything scheduled while running waits for
    // the next call even when its deadline has already passed.
    std::vector<std::pair<TimePoint, TimerId>> due;
    for (const auto &t : m_timers) {
        if (t.deadline <= m_now)
            due.emplace_back(t.deadline, t.id);
    }
    std::sort(due.begin(), due.end());

    for (const auto &entry : due) {
        const TimerId id = entry.second;
        auto it = std::find_if(m_timers.begin(), m_timers.end(),
                               [id](const Timer &t) { return t.id == id; });
        if (it == m_timers.end())
            continue; // cancelled by an earlier task
        Task task = std::move(it->task);
        m_timers.erase(it);
        task();
        ++executed;
    }

    return executed;
}
