/**
 * @file event_bus.hpp
 * @brief Type-safe event bus connecting the upload engine to its observers
 *
 * WHAT IT DOES:
 * - The session authority, finalizer, reaper and stream service emit domain
 *   events without knowing who listens
 * - Logging and metrics subscribe without knowing who emits
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<ChunkAcceptedEvent>([](const ChunkAcceptedEvent& e) { ... });
 * bus.emit(ChunkAcceptedEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace rms::events {

/**
 * @brief Type-safe synchronous event bus
 *
 * THREAD SAFETY:
 * - emit() and subscribe() may be called concurrently from any thread
 * - Handlers run synchronously in the emitting thread, outside the bus lock,
 *   so a handler may subscribe or emit without deadlocking
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Subscribe to events of one type
     *
     * RETURNS:
     * Subscription id for unsubscribe()
     */
    template<typename EventType>
    std::size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        auto wrapper = std::make_shared<HandlerImpl<EventType>>(std::move(handler));
        const std::size_t handler_id = next_handler_id_++;
        handlers_[std::type_index(typeid(EventType))].push_back({handler_id, wrapper});
        return handler_id;
    }

    template<typename EventType>
    void unsubscribe(std::size_t handler_id) {
        std::unique_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }
        auto& handler_list = it->second;
        handler_list.erase(
            std::remove_if(handler_list.begin(), handler_list.end(),
                [handler_id](const auto& entry) { return entry.first == handler_id; }),
            handler_list.end());
    }

    /**
     * @brief Deliver an event to every subscriber of its type
     *
     * EXCEPTION SAFETY:
     * A handler that throws is logged and skipped; the remaining handlers
     * still run and the emitter never sees the exception.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        std::vector<std::shared_ptr<HandlerBase>> handlers_copy;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            for (const auto& [id, handler] : it->second) {
                handlers_copy.push_back(handler);
            }
        }

        for (auto& handler : handlers_copy) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] handler for {} threw: {}", typeid(EventType).name(), e.what());
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
    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) = 0;
    };

    template<typename EventType>
    struct HandlerImpl : HandlerBase {
        std::function<void(const EventType&)> func;

        explicit HandlerImpl(std::function<void(const EventType&)> f) : func(std::move(f)) {}

        void call(const void* event) override {
            func(*static_cast<const EventType*>(event));
        }
    };

    std::unordered_map<std::type_index,
                       std::vector<std::pair<std::size_t, std::shared_ptr<HandlerBase>>>> handlers_;
    mutable std::shared_mutex mutex_;
    std::size_t next_handler_id_ = 0;
};

} // namespace rms::events
