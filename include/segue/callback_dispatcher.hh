//
// Marshals backend notifications onto the thread that owns the transport.
//

#ifndef SEGUE_CALLBACK_DISPATCHER_HH
#define SEGUE_CALLBACK_DISPATCHER_HH

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <utility>
#include <segue/export_segue.h>

namespace segue {

    /**
     * callback_dispatcher queues callbacks posted from any thread (typically
     * an audio thread) and runs them on the owning thread when it calls
     * dispatch() from its event loop.
     *
     * Each callback carries a token naming its producer so that a producer
     * being torn down can drop whatever it still has queued.
     */
    class SEGUE_EXPORT callback_dispatcher {
        public:
            using token_t = int;
            using callback_t = std::pair <token_t, std::function <void()>>;

            callback_dispatcher() = default;
            ~callback_dispatcher() = default;
            callback_dispatcher(const callback_dispatcher&) = delete;
            callback_dispatcher& operator=(const callback_dispatcher&) = delete;

            /**
             * Hand out a token for a new producer.
             */
            token_t register_producer();

            /**
             * Enqueue a callback. Safe to call from any thread.
             */
            void enqueue(token_t token, std::function <void()> cbk);

            /**
             * Run every queued callback on the calling thread.
             * Callbacks enqueued while dispatching run on the next call.
             * @return Number of callbacks run
             */
            std::size_t dispatch();

            /**
             * Drop queued callbacks of one producer.
             */
            void cleanup(token_t token);

            [[nodiscard]] std::size_t pending() const;

        private:
            std::deque <callback_t> m_queue;
            mutable std::mutex m_mutex;
            token_t m_next_token = 0;
    };

} // namespace segue

#endif // SEGUE_CALLBACK_DISPATCHER_HH
