//
// Created by Giuseppe Francione on 03/03/26.
//

/**
 * @file event_bus.hpp
 * @brief Thread-safe publish/subscribe event bus.
 */

#ifndef TRAWL_EVENT_BUS_HPP
#define TRAWL_EVENT_BUS_HPP

#include <cstddef>
#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace trawl {

    /**
     * @brief Type-safe publish/subscribe bus between the library and its host.
     *
     * @details Workers publish job events without knowing who listens; the
     * CLI subscribes to print progress and collect report rows.
     *
     * Handlers run while the bus lock is held, so handlers for all event
     * types are serialized. Subscribers may therefore keep unsynchronized
     * state (counters, result vectors), but must not publish from inside a
     * handler.
     */
    class EventBus {
    public:
        EventBus() = default;
        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g., JobCompleteEvent).
         * @param handler Invoked with a const reference for each published event.
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            subscribers_[key<Event>()].emplace_back(
                [h = std::move(handler)](const void* e) {
                    h(*static_cast<const Event*>(e));
                });
        }

        /**
         * @brief Publish an event to all subscribers of its type.
         * @return Number of handlers that received the event.
         */
        template <typename Event>
        std::size_t publish(const Event& event) {
            std::lock_guard lock(mtx_);
            const auto it = subscribers_.find(key<Event>());
            if (it == subscribers_.end()) {
                return 0;
            }
            for (const auto& fn : it->second) {
                fn(&event);
            }
            return it->second.size();
        }

        /**
         * @brief Number of handlers currently subscribed to an event type.
         */
        template <typename Event>
        [[nodiscard]] std::size_t subscriber_count() const {
            std::lock_guard lock(mtx_);
            const auto it = subscribers_.find(key<Event>());
            return it == subscribers_.end() ? 0 : it->second.size();
        }

        /**
         * @brief Drop every subscription.
         */
        void clear() {
            std::lock_guard lock(mtx_);
            subscribers_.clear();
        }

    private:
        using Callback = std::function<void(const void*)>;

        template <typename Event>
        static std::type_index key() {
            return std::type_index(typeid(Event));
        }

        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        mutable std::mutex mtx_;
    };

} // namespace trawl

#endif // TRAWL_EVENT_BUS_HPP
