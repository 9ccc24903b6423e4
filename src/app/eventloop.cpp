#include "eventloop.hpp"

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <system_error>

#include <spdlog/spdlog.h>

namespace devflow::app {

EventLoop::EventLoop() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ == -1) {
        throw std::system_error(errno, std::generic_category(),
                                "epoll_create1 failed");
    }

    wakeup_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wakeup_fd_ == -1) {
        int err = errno;
        close(epoll_fd_);
        throw std::system_error(err, std::generic_category(),
                                "eventfd failed");
    }

    epoll_event event{};
    event.events = EPOLLIN;
    event.data.fd = wakeup_fd_;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wakeup_fd_, &event) == -1) {
        int err = errno;
        close(wakeup_fd_);
        close(epoll_fd_);
        throw std::system_error(err, std::generic_category(),
                                "epoll_ctl(wakeup) failed");
    }

    spdlog::debug("EventLoop: initialized (epoll fd {})", epoll_fd_);
}

EventLoop::~EventLoop() {
    if (!watchers_.empty()) {
        spdlog::debug("EventLoop: destroyed with {} watched descriptors",
                      watchers_.size());
    }
    if (wakeup_fd_ != -1) {
        close(wakeup_fd_);
    }
    if (epoll_fd_ != -1) {
        close(epoll_fd_);
    }
}

void EventLoop::run() {
    stop_flag_.store(false);
    while (!stop_flag_.load() && hasPendingWork()) {
        runOnce(std::chrono::milliseconds(1000));
    }
}

auto EventLoop::runUntil(const std::function<bool()>& done,
                         std::optional<std::chrono::milliseconds> timeout)
    -> bool {
    stop_flag_.store(false);
    const auto deadline =
        timeout ? std::optional<Clock::time_point>(Clock::now() + *timeout)
                : std::nullopt;

    while (!done()) {
        if (stop_flag_.load() || !hasPendingWork()) {
            break;
        }
        auto wait = std::chrono::milliseconds(100);
        if (deadline) {
            auto now = Clock::now();
            if (now >= *deadline) {
                break;
            }
            auto remaining =
                std::chrono::ceil<std::chrono::milliseconds>(*deadline - now);
            wait = std::min(wait, remaining);
        }
        runOnce(wait);
    }
    return done();
}

auto EventLoop::runOnce(std::chrono::milliseconds maxWait) -> std::size_t {
    constexpr int kMaxEvents = 32;
    std::array<epoll_event, kMaxEvents> events{};

    int count = epoll_wait(epoll_fd_, events.data(), kMaxEvents,
                           nextTimeout(maxWait));
    if (count == -1) {
        if (errno != EINTR) {
            spdlog::warn("EventLoop: epoll_wait failed: errno {}", errno);
        }
        count = 0;
    }

    std::size_t dispatched = 0;
    for (int i = 0; i < count; ++i) {
        const int fd = events[i].data.fd;
        if (fd == wakeup_fd_) {
            drainWakeup();
            continue;
        }

        auto it = watchers_.find(fd);
        if (it == watchers_.end()) {
            // Unwatched by an earlier callback in this round
            continue;
        }
        auto handler = it->second;
        try {
            (*handler)(events[i].events);
        } catch (const std::exception& e) {
            spdlog::error("EventLoop: I/O callback for fd {} threw: {}", fd,
                          e.what());
        }
        ++dispatched;
    }

    dispatched += dispatchTimers();
    dispatched += dispatchPosted();
    return dispatched;
}

void EventLoop::stop() {
    stop_flag_.store(true);
    wakeup();
}

void EventLoop::post(Callback callback) {
    {
        std::lock_guard lock(posted_mutex_);
        posted_.push_back(std::move(callback));
    }
    wakeup();
}

auto EventLoop::setTimeout(Callback callback, std::chrono::milliseconds delay)
    -> TimerId {
    return scheduleTimer(std::move(callback), delay,
                         std::chrono::milliseconds(0));
}

auto EventLoop::setInterval(Callback callback,
                            std::chrono::milliseconds interval) -> TimerId {
    if (interval.count() <= 0) {
        spdlog::warn("EventLoop: rejecting interval of {}ms",
                     interval.count());
        return kInvalidTimer;
    }
    return scheduleTimer(std::move(callback), interval, interval);
}

auto EventLoop::scheduleTimer(Callback callback,
                              std::chrono::milliseconds delay,
                              std::chrono::milliseconds interval) -> TimerId {
    const TimerId id = next_timer_id_++;
    const auto deadline =
        Clock::now() + std::max(delay, std::chrono::milliseconds(0));
    timers_.emplace(id, Timer{std::move(callback), deadline, interval});
    schedule_.emplace(deadline, id);
    return id;
}

auto EventLoop::cancelTimer(TimerId id) -> bool {
    auto it = timers_.find(id);
    if (it == timers_.end()) {
        return false;
    }

    auto [first, last] = schedule_.equal_range(it->second.deadline);
    for (auto entry = first; entry != last; ++entry) {
        if (entry->second == id) {
            schedule_.erase(entry);
            break;
        }
    }
    timers_.erase(it);
    return true;
}

auto EventLoop::isTimerPending(TimerId id) const -> bool {
    return timers_.contains(id);
}

auto EventLoop::watchFd(int fd, IoCallback callback) -> bool {
    epoll_event event{};
    event.events = EPOLLIN;
    event.data.fd = fd;

    const bool existing = watchers_.contains(fd);
    const int op = existing ? EPOLL_CTL_MOD : EPOLL_CTL_ADD;
    if (epoll_ctl(epoll_fd_, op, fd, &event) == -1) {
        spdlog::error("EventLoop: failed to watch fd {}: errno {}", fd, errno);
        return false;
    }

    watchers_[fd] = std::make_shared<IoCallback>(std::move(callback));
    return true;
}

void EventLoop::unwatchFd(int fd) {
    if (watchers_.erase(fd) == 0) {
        return;
    }
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr) == -1) {
        spdlog::debug("EventLoop: epoll_ctl(DEL) for fd {} failed: errno {}",
                      fd, errno);
    }
}

auto EventLoop::hasPendingWork() const -> bool {
    if (!timers_.empty() || !watchers_.empty()) {
        return true;
    }
    std::lock_guard lock(posted_mutex_);
    return !posted_.empty();
}

auto EventLoop::pendingTimerCount() const -> std::size_t {
    return timers_.size();
}

auto EventLoop::watchedFdCount() const -> std::size_t {
    return watchers_.size();
}

auto EventLoop::nextTimeout(std::chrono::milliseconds maxWait) const -> int {
    {
        std::lock_guard lock(posted_mutex_);
        if (!posted_.empty()) {
            return 0;
        }
    }

    auto wait = std::max(maxWait, std::chrono::milliseconds(0));
    if (!schedule_.empty()) {
        auto untilNext = std::chrono::ceil<std::chrono::milliseconds>(
            schedule_.begin()->first - Clock::now());
        wait = std::clamp(untilNext, std::chrono::milliseconds(0), wait);
    }
    return static_cast<int>(wait.count());
}

auto EventLoop::dispatchTimers() -> std::size_t {
    std::size_t dispatched = 0;
    const auto now = Clock::now();

    while (!schedule_.empty() && schedule_.begin()->first <= now) {
        const TimerId id = schedule_.begin()->second;
        schedule_.erase(schedule_.begin());

        auto it = timers_.find(id);
        if (it == timers_.end()) {
            continue;
        }

        Callback callback = it->second.callback;
        if (it->second.interval.count() > 0) {
            auto next = it->second.deadline + it->second.interval;
            if (next <= now) {
                next = now + it->second.interval;
            }
            it->second.deadline = next;
            schedule_.emplace(next, id);
        } else {
            timers_.erase(it);
        }

        try {
            callback();
        } catch (const std::exception& e) {
            spdlog::error("EventLoop: timer {} callback threw: {}", id,
                          e.what());
        }
        ++dispatched;
    }
    return dispatched;
}

auto EventLoop::dispatchPosted() -> std::size_t {
    std::vector<Callback> ready;
    {
        std::lock_guard lock(posted_mutex_);
        ready.swap(posted_);
    }

    for (auto& callback : ready) {
        try {
            callback();
        } catch (const std::exception& e) {
            spdlog::error("EventLoop: posted callback threw: {}", e.what());
        }
    }
    return ready.size();
}

void EventLoop::drainWakeup() {
    std::uint64_t value = 0;
    while (read(wakeup_fd_, &value, sizeof(value)) > 0) {
    }
}

void EventLoop::wakeup() {
    std::uint64_t one = 1;
    if (write(wakeup_fd_, &one, sizeof(one)) == -1 && errno != EAGAIN) {
        spdlog::warn("EventLoop: wakeup write failed: errno {}", errno);
    }
}

}  // namespace devflow::app
