/**
 * @file event_bus.hpp
 * @brief Type-safe in-process event bus
 *
 * Backup and restore drivers emit events without knowing who listens;
 * the logger and metrics components subscribe without knowing who emits.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<SegmentWrittenEvent>([](const SegmentWrittenEvent& e) { ... });
 * bus.emit(SegmentWrittenEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace strata::events {

/**
 * @brief Dispatches events to subscribers keyed by the event's static type
 *
 * Handlers run synchronously in the emitting thread, in subscription order.
 * A handler that throws is logged and the remaining handlers still run.
 */
class EventBus {
public:
    using HandlerId = std::size_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register a handler for EventType
     *
     * RETURNS:
     * Id to pass to unsubscribe()
     */
    template<typename EventType>
    HandlerId subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        const HandlerId id = next_handler_id_++;
        handlers_[std::type_index(typeid(EventType))].emplace_back(
            id, std::make_shared<TypedHandler<EventType>>(std::move(handler)));
        return id;
    }

    template<typename EventType>
    void unsubscribe(HandlerId id) {
        std::unique_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [id](const auto& entry) { return entry.first == id; }),
                   list.end());
    }

    template<typename EventType>
    void emit(const EventType& event) {
        // Copy out so a handler may subscribe without deadlocking
        std::vector<std::shared_ptr<Handler>> targets;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            targets.reserve(it->second.size());
            for (const auto& entry : it->second) {
                targets.push_back(entry.second);
            }
        }

        for (const auto& handler : targets) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    struct Handler {
        virtual ~Handler() = default;
        virtual void call(const void* event) = 0;
    };

    template<typename EventType>
    struct TypedHandler : Handler {
        std::function<void(const EventType&)> func;

        explicit TypedHandler(std::function<void(const EventType&)> f) : func(std::move(f)) {}

        void call(const void* event) override {
            func(*static_cast<const EventType*>(event));
        }
    };

    std::unordered_map<std::type_index, std::vector<std::pair<HandlerId, std::shared_ptr<Handler>>>> handlers_;
    mutable std::shared_mutex mutex_;
    HandlerId next_handler_id_ = 0;
};

} // namespace strata::events
