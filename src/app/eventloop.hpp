#ifndef DEVFLOW_APP_EVENTLOOP_HPP
#define DEVFLOW_APP_EVENTLOOP_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace devflow::app {

/**
 * @brief Single-threaded event loop multiplexing timers, file descriptor
 * readiness and posted callbacks.
 *
 * Every callback runs on the thread that calls run()/runOnce(). Timers and
 * descriptor watches must be registered from that thread; post() and stop()
 * may be called from any thread. Callbacks must be short and non-blocking:
 * a slow callback delays delivery of every other pending event.
 */
class EventLoop {
public:
    using Callback = std::function<void()>;
    using IoCallback = std::function<void(std::uint32_t events)>;
    using TimerId = std::uint64_t;
    using Clock = std::chrono::steady_clock;

    /// Returned by timer registration when nothing was scheduled
    static constexpr TimerId kInvalidTimer = 0;

    /**
     * @brief Creates the epoll instance and the wakeup eventfd.
     * @throws std::system_error if either cannot be created
     */
    EventLoop();

    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /**
     * @brief Runs until stop() is called or no work remains.
     */
    void run();

    /**
     * @brief Runs until the predicate holds, stop() is called, or the
     * optional deadline passes.
     *
     * @param done Checked after every dispatch round
     * @param timeout Upper bound on the total wait
     * @return The final value of the predicate
     */
    auto runUntil(const std::function<bool()>& done,
                  std::optional<std::chrono::milliseconds> timeout =
                      std::nullopt) -> bool;

    /**
     * @brief Performs one dispatch round.
     *
     * Waits at most @p maxWait for I/O (less if a timer is due sooner), then
     * dispatches ready descriptors, due timers and posted callbacks.
     *
     * @return Number of callbacks invoked
     */
    auto runOnce(std::chrono::milliseconds maxWait) -> std::size_t;

    /**
     * @brief Requests run()/runUntil() to return after the current round.
     */
    void stop();

    /**
     * @brief Queues a callback for the next dispatch round. Thread-safe.
     */
    void post(Callback callback);

    /**
     * @brief Executes a function once after the delay.
     * @return Identifier usable with cancelTimer()
     */
    auto setTimeout(Callback callback, std::chrono::milliseconds delay)
        -> TimerId;

    /**
     * @brief Executes a function repeatedly at the interval until cancelled.
     * @return Identifier usable with cancelTimer()
     */
    auto setInterval(Callback callback, std::chrono::milliseconds interval)
        -> TimerId;

    /**
     * @brief Cancels a pending timer.
     * @return true if the timer was still pending
     */
    auto cancelTimer(TimerId id) -> bool;

    [[nodiscard]] auto isTimerPending(TimerId id) const -> bool;

    /**
     * @brief Watches a descriptor for readability (EPOLLIN, EPOLLHUP, EPOLLERR).
     * @return false if epoll rejected the descriptor
     */
    auto watchFd(int fd, IoCallback callback) -> bool;

    /**
     * @brief Stops watching a descriptor. Safe to call from its own callback.
     */
    void unwatchFd(int fd);

    /**
     * @brief True while timers, watched descriptors or posted callbacks remain.
     */
    [[nodiscard]] auto hasPendingWork() const -> bool;

    [[nodiscard]] auto pendingTimerCount() const -> std::size_t;
    [[nodiscard]] auto watchedFdCount() const -> std::size_t;

private:
    struct Timer {
        Callback callback;
        Clock::time_point deadline;
        std::chrono::milliseconds interval{0};  ///< Zero for one-shot timers
    };

    auto scheduleTimer(Callback callback, std::chrono::milliseconds delay,
                       std::chrono::milliseconds interval) -> TimerId;
    auto nextTimeout(std::chrono::milliseconds maxWait) const -> int;
    auto dispatchTimers() -> std::size_t;
    auto dispatchPosted() -> std::size_t;
    void drainWakeup();
    void wakeup();

    int epoll_fd_{-1};
    int wakeup_fd_{-1};
    std::atomic<bool> stop_flag_{false};

    TimerId next_timer_id_{1};
    std::unordered_map<TimerId, Timer> timers_;
    std::multimap<Clock::time_point, TimerId> schedule_;

    std::unordered_map<int, std::shared_ptr<IoCallback>> watchers_;

    mutable std::mutex posted_mutex_;
    std::vector<Callback> posted_;
};

}  // namespace devflow::app

#endif  // DEVFLOW_APP_EVENTLOOP_HPP
