#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <vector>

/**
 * @brief Cooperative single-threaded scheduler driving the UI thread.
 *
 * Not thread-safe: only the UI thread schedules, cancels and runs timers.
 * Other threads hand work over through PointerQueue and WindowEventChannel.
 * Deadlines are measured from the time passed to the most recent run_due(),
 * which keeps the loop fully deterministic when driven with synthetic time
 * points.
 */
class EventLoop {
  public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::duration<double>;
    using Task = std::function<void()>;
    using TimerId = std::uint64_t;

    static constexpr TimerId kInvalidTimer = 0;

    explicit EventLoop(TimePoint now = Clock::now()) : m_now(now) {}
    EventLoop(const EventLoop &) = delete;
    EventLoop &operator=(const EventLoop &) = delete;

    /**
     * @brief Run a task once, delay after the loop's current time
     * @return Handle usable with cancel() and is_pending()
     */
    TimerId schedule(Duration delay, Task task);

    /**
     * @brief Cancel a pending timer
     * @return true if the timer was still pending
     */
    bool cancel(TimerId id);

    bool is_pending(TimerId id) const;

    /**
     * @brief Advance the loop's clock to now and run every timer that was
     * due at entry, in deadline order
     * @return Number of timers executed
     */
    std::size_t run_due(TimePoint now);

    TimePoint now() const { return m_now; }
    std::size_t pending_timers() const { return m_timers.size(); }

  private:
    struct Timer {
        TimerId id;
        TimePoint deadline;
        Task task;
    };

    std::vector<Timer> m_timers;
    TimerId m_next_id = 1;
    TimePoint m_now;
};
