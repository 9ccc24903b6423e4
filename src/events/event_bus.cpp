/*
 * event_bus.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "event_bus.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace devflow::events {

auto ExecutionEvent::output(std::string id, std::string text)
    -> ExecutionEvent {
    ExecutionEvent event;
    event.kind = EventKind::Output;
    event.executionId = std::move(id);
    event.text = std::move(text);
    return event;
}

auto ExecutionEvent::error(std::string id, std::string text)
    -> ExecutionEvent {
    ExecutionEvent event;
    event.kind = EventKind::Error;
    event.executionId = std::move(id);
    event.text = std::move(text);
    return event;
}

auto ExecutionEvent::progressUpdate(std::string id, int percent)
    -> ExecutionEvent {
    ExecutionEvent event;
    event.kind = EventKind::Progress;
    event.executionId = std::move(id);
    event.progress = std::clamp(percent, 0, 100);
    return event;
}

auto ExecutionEvent::status(std::string id, std::string text)
    -> ExecutionEvent {
    ExecutionEvent event;
    event.kind = EventKind::Status;
    event.executionId = std::move(id);
    event.text = std::move(text);
    return event;
}

auto ExecutionEvent::complete(std::string id, ProcessResult result)
    -> ExecutionEvent {
    ExecutionEvent event;
    event.kind = EventKind::Complete;
    event.executionId = std::move(id);
    event.progress = 100;
    event.result = std::move(result);
    return event;
}

auto ExecutionEvent::toJson() const -> nlohmann::json {
    nlohmann::json j{{"kind", std::string(eventKindToString(kind))},
                     {"executionId", executionId},
                     {"timestamp", formatTimestamp(timestamp)}};
    switch (kind) {
        case EventKind::Output:
        case EventKind::Error:
        case EventKind::Status:
            j["text"] = text;
            break;
        case EventKind::Progress:
            j["progress"] = progress;
            break;
        case EventKind::Complete:
            if (result) {
                j["result"] = result->toJson();
            }
            break;
    }
    return j;
}

// ============================================================================
// Subscription
// ============================================================================

Subscription::Subscription(std::weak_ptr<EventBus> bus, std::uint64_t id)
    : bus_(std::move(bus)), id_(id) {}

Subscription::~Subscription() { unsubscribe(); }

Subscription::Subscription(Subscription&& other) noexcept
    : bus_(std::move(other.bus_)), id_(std::exchange(other.id_, 0)) {}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        unsubscribe();
        bus_ = std::move(other.bus_);
        id_ = std::exchange(other.id_, 0);
    }
    return *this;
}

void Subscription::unsubscribe() {
    if (id_ == 0) {
        return;
    }
    if (auto bus = bus_.lock()) {
        bus->remove(id_);
    }
    bus_.reset();
    id_ = 0;
}

auto Subscription::active() const -> bool {
    if (id_ == 0) {
        return false;
    }
    auto bus = bus_.lock();
    return bus && bus->contains(id_);
}

// ============================================================================
// EventBus
// ============================================================================

auto EventBus::create() -> std::shared_ptr<EventBus> {
    return std::shared_ptr<EventBus>(new EventBus());
}

auto EventBus::subscribe(Listener listener) -> Subscription {
    return add(std::nullopt, std::nullopt, std::move(listener));
}

auto EventBus::subscribe(EventKind kind, Listener listener) -> Subscription {
    return add(kind, std::nullopt, std::move(listener));
}

auto EventBus::subscribeTo(std::string executionId, Listener listener)
    -> Subscription {
    return add(std::nullopt, std::move(executionId), std::move(listener));
}

auto EventBus::add(std::optional<EventKind> kind,
                   std::optional<std::string> executionId, Listener listener)
    -> Subscription {
    if (!listener) {
        spdlog::warn("EventBus: ignoring empty listener");
        return {};
    }
    const auto id = next_id_++;
    entries_.push_back(Entry{id, kind, std::move(executionId),
                             std::make_shared<Listener>(std::move(listener))});
    spdlog::trace("EventBus: added subscriber {}", id);
    return Subscription(weak_from_this(), id);
}

auto EventBus::remove(std::uint64_t id) -> bool {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [id](const Entry& e) { return e.id == id; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    spdlog::trace("EventBus: removed subscriber {}", id);
    return true;
}

auto EventBus::contains(std::uint64_t id) const -> bool {
    return std::any_of(entries_.begin(), entries_.end(),
                       [id](const Entry& e) { return e.id == id; });
}

void EventBus::publish(const ExecutionEvent& event) {
    ++published_;

    // Listeners may subscribe or unsubscribe while being notified
    std::vector<std::pair<std::uint64_t, std::shared_ptr<Listener>>> targets;
    targets.reserve(entries_.size());
    for (const auto& entry : entries_) {
        if (entry.kind && *entry.kind != event.kind) {
            continue;
        }
        if (entry.executionId && *entry.executionId != event.executionId) {
            continue;
        }
        targets.emplace_back(entry.id, entry.listener);
    }

    for (const auto& [id, listener] : targets) {
        if (!contains(id)) {
            continue;
        }
        try {
            (*listener)(event);
        } catch (const std::exception& e) {
            spdlog::error("EventBus: subscriber {} threw on {} event: {}", id,
                          eventKindToString(event.kind), e.what());
        }
    }
}

auto EventBus::subscriberCount() const -> std::size_t {
    return entries_.size();
}

}  // namespace devflow::events
