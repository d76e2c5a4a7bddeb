/**
 * @file event_bus.hh
 * @brief Typed publish/subscribe registry
 * @ingroup events
 */

#ifndef SEGUE_EVENT_BUS_HH
#define SEGUE_EVENT_BUS_HH

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <utility>
#include <vector>
#include <segue/events.hh>
#include <segue/export_segue.h>

namespace segue {

    /**
     * @class event_bus
     * @brief Per-event-type subscriber lists with token based removal
     *
     * Handlers run synchronously on the publishing thread in subscription
     * order. A handler may subscribe or unsubscribe (itself included) while
     * an event is being delivered; the change applies from the next publish.
     * A handler that throws is logged and skipped.
     *
     * @code
     * auto token = bus.subscribe<track_changed_event>([](const track_changed_event& e) {
     *     if (e.track) {
     *         std::cout << "Now playing " << e.track->title << "\n";
     *     }
     * });
     * ...
     * bus.unsubscribe(token);
     * @endcode
     *
     * Not thread-safe: use from the thread that owns the transport.
     */
    class SEGUE_EXPORT event_bus {
        public:
            using token_t = uint64_t;
            using handler_t = std::function <void(const playback_event&)>;

            event_bus() = default;
            event_bus(const event_bus&) = delete;
            event_bus& operator=(const event_bus&) = delete;

            /**
             * @brief Subscribe to one event type with an untyped handler
             * @return Token for unsubscribe()
             */
            token_t subscribe(event_type type, handler_t handler);

            /**
             * @brief Subscribe with a handler taking the concrete event struct
             */
            template <typename Event>
            token_t subscribe(std::function <void(const Event&)> handler) {
                return subscribe(Event::type, [h = std::move(handler)](const playback_event& ev) {
                    h(std::get <Event>(ev));
                });
            }

            /**
             * @brief Remove a subscription
             * @return false if the token is unknown or already removed
             */
            bool unsubscribe(token_t token);

            void publish(const playback_event& event);

            /**
             * @brief Drop every subscription
             */
            void clear();

            [[nodiscard]] std::size_t subscriber_count(event_type type) const;

        private:
            struct subscriber {
                token_t token;
                handler_t handler;
            };

            std::map <event_type, std::vector <subscriber>> m_subscribers;
            token_t m_next_token = 1;
    };

} // namespace segue

#endif // SEGUE_EVENT_BUS_HH
