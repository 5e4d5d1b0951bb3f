/**
 * @file event_bus.hpp
 * @brief Type-safe publish/subscribe bus for upload lifecycle events
 *
 * WHY THIS FILE EXISTS:
 * The upload pipeline reports progress (chunk acknowledged, commit issued,
 * status polled) without knowing who listens. Logging and metrics subscribe
 * here instead of being wired into the coordinator.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto sub = bus.subscribe<ChunkUploadedEvent>([](const ChunkUploadedEvent& e) { ... });
 * bus.emit(ChunkUploadedEvent{0, 0, 100});
 * // handler detaches when `sub` goes out of scope
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace dsup::events {

namespace detail {

using ErasedHandler = std::function<void(const void*)>;

struct HandlerEntry {
    std::size_t id;
    std::shared_ptr<ErasedHandler> handler;
};

/// Shared between the bus and its subscriptions so either may go first
struct HandlerTable {
    std::unordered_map<std::type_index, std::vector<HandlerEntry>> by_type;
    std::shared_mutex mutex;
    std::size_t next_id = 1;

    void remove(std::size_t id) {
        std::unique_lock lock(mutex);
        for (auto& [type, entries] : by_type) {
            entries.erase(std::remove_if(entries.begin(), entries.end(),
                                         [id](const HandlerEntry& entry) { return entry.id == id; }),
                          entries.end());
        }
    }
};

} // namespace detail

/**
 * @brief Owns one handler registration; unsubscribes on destruction
 *
 * Outliving the bus is harmless.
 */
class Subscription {
public:
    Subscription() = default;
    Subscription(std::weak_ptr<detail::HandlerTable> table, std::size_t id)
        : table_(std::move(table)), id_(id) {}

    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept
        : table_(std::move(other.table_)), id_(other.id_) {
        other.id_ = 0;
    }

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            table_ = std::move(other.table_);
            id_ = other.id_;
            other.id_ = 0;
        }
        return *this;
    }

    /// Detach the handler now
    void reset() {
        if (id_ == 0) {
            return;
        }
        if (auto table = table_.lock()) {
            table->remove(id_);
        }
        table_.reset();
        id_ = 0;
    }

    /// Keep the handler registered for the bus's lifetime
    std::size_t release() {
        const auto id = id_;
        table_.reset();
        id_ = 0;
        return id;
    }

    bool active() const { return id_ != 0 && !table_.expired(); }

    std::size_t id() const { return id_; }

private:
    std::weak_ptr<detail::HandlerTable> table_;
    std::size_t id_ = 0;
};

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - emit() may be called from worker threads concurrently
 * - Handlers run synchronously in the emitting thread, so handlers
 *   subscribed to worker-side events must be thread-safe themselves
 */
class EventBus {
public:
    EventBus() : table_(std::make_shared<detail::HandlerTable>()) {}

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename EventType>
    [[nodiscard]] Subscription subscribe(std::function<void(const EventType&)> handler) {
        auto erased = std::make_shared<detail::ErasedHandler>(
            [fn = std::move(handler)](const void* event) { fn(*static_cast<const EventType*>(event)); });

        std::unique_lock lock(table_->mutex);
        const std::size_t id = table_->next_id++;
        table_->by_type[std::type_index(typeid(EventType))].push_back({id, std::move(erased)});
        return Subscription(table_, id);
    }

    void unsubscribe(std::size_t handler_id) { table_->remove(handler_id); }

    /**
     * @brief Deliver an event to every subscriber of its type
     *
     * A throwing handler is logged and skipped; remaining handlers still run.
     * Handlers are snapshotted first so one may subscribe without deadlocking.
     */
    template<typename EventType>
    void emit(const EventType& event) const {
        std::vector<std::shared_ptr<detail::ErasedHandler>> snapshot;
        {
            std::shared_lock lock(table_->mutex);
            auto it = table_->by_type.find(std::type_index(typeid(EventType)));
            if (it == table_->by_type.end()) {
                return;
            }
            snapshot.reserve(it->second.size());
            for (const auto& entry : it->second) {
                snapshot.push_back(entry.handler);
            }
        }

        for (const auto& handler : snapshot) {
            try {
                (*handler)(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(table_->mutex);
        auto it = table_->by_type.find(std::type_index(typeid(EventType)));
        return it != table_->by_type.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(table_->mutex);
        table_->by_type.clear();
    }

private:
    std::shared_ptr<detail::HandlerTable> table_;
};

} // namespace dsup::events
