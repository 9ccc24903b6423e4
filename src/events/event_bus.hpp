/*
 * event_bus.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file event_bus.hpp
 * @brief Typed fan-out of execution lifecycle events
 * @date 2025-03-02
 * @version 1.0.0
 *
 * Subscribers register a listener, optionally filtered by event kind, and
 * receive a Subscription handle. Destroying or resetting the handle removes
 * the listener, so repeated executions never accumulate stale listeners.
 */

#ifndef DEVFLOW_EVENTS_EVENT_BUS_HPP
#define DEVFLOW_EVENTS_EVENT_BUS_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/types.hpp"

namespace devflow::events {

/**
 * @brief Kinds of events published during an execution
 */
enum class EventKind {
    Output,    ///< Incremental stdout text
    Error,     ///< Incremental stderr text
    Progress,  ///< Progress percentage 0-100
    Status,    ///< Human-readable status line
    Complete   ///< Terminal result, exactly once per execution
};

[[nodiscard]] constexpr std::string_view eventKindToString(
    EventKind kind) noexcept {
    switch (kind) {
        case EventKind::Output: return "output";
        case EventKind::Error: return "error";
        case EventKind::Progress: return "progress";
        case EventKind::Status: return "status";
        case EventKind::Complete: return "complete";
    }
    return "status";
}

/**
 * @brief One published event
 */
struct ExecutionEvent {
    EventKind kind{EventKind::Status};
    std::string executionId;              ///< Execution or batch identifier
    std::string text;                     ///< Output/Error/Status payload
    int progress{0};                      ///< Progress payload
    std::optional<ProcessResult> result;  ///< Complete payload
    TimePoint timestamp{SystemClock::now()};

    static auto output(std::string id, std::string text) -> ExecutionEvent;
    static auto error(std::string id, std::string text) -> ExecutionEvent;
    static auto progressUpdate(std::string id, int percent) -> ExecutionEvent;
    static auto status(std::string id, std::string text) -> ExecutionEvent;
    static auto complete(std::string id, ProcessResult result)
        -> ExecutionEvent;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

using Listener = std::function<void(const ExecutionEvent&)>;

class EventBus;

/**
 * @brief Move-only handle owning one listener registration
 */
class Subscription {
public:
    Subscription() = default;
    Subscription(std::weak_ptr<EventBus> bus, std::uint64_t id);
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;

    /**
     * @brief Removes the listener. Idempotent.
     */
    void unsubscribe();

    [[nodiscard]] auto active() const -> bool;
    [[nodiscard]] auto id() const noexcept -> std::uint64_t { return id_; }

private:
    std::weak_ptr<EventBus> bus_;
    std::uint64_t id_{0};
};

/**
 * @brief Explicit subscriber list with typed events
 *
 * Must be owned by a std::shared_ptr so that subscriptions can detect when
 * the bus is gone. Listeners run synchronously on the publishing thread in
 * registration order. A listener that throws is logged and skipped.
 */
class EventBus : public std::enable_shared_from_this<EventBus> {
public:
    static auto create() -> std::shared_ptr<EventBus>;

    /**
     * @brief Subscribes to every event kind
     */
    [[nodiscard]] auto subscribe(Listener listener) -> Subscription;

    /**
     * @brief Subscribes to a single event kind
     */
    [[nodiscard]] auto subscribe(EventKind kind, Listener listener)
        -> Subscription;

    /**
     * @brief Subscribes to the events of one execution id
     */
    [[nodiscard]] auto subscribeTo(std::string executionId, Listener listener)
        -> Subscription;

    void publish(const ExecutionEvent& event);

    [[nodiscard]] auto subscriberCount() const -> std::size_t;
    [[nodiscard]] auto publishedCount() const noexcept -> std::uint64_t {
        return published_;
    }

private:
    friend class Subscription;

    EventBus() = default;

    struct Entry {
        std::uint64_t id;
        std::optional<EventKind> kind;
        std::optional<std::string> executionId;
        std::shared_ptr<Listener> listener;
    };

    auto add(std::optional<EventKind> kind,
             std::optional<std::string> executionId, Listener listener)
        -> Subscription;
    auto remove(std::uint64_t id) -> bool;
    [[nodiscard]] auto contains(std::uint64_t id) const -> bool;

    std::vector<Entry> entries_;
    std::uint64_t next_id_{1};
    std::uint64_t published_{0};
};

}  // namespace devflow::events

#endif  // DEVFLOW_EVENTS_EVENT_BUS_HPP
