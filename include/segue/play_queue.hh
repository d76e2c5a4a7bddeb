/**
 * @file play_queue.hh
 * @brief Two-tier play queue (explicit + source)
 * @ingroup core
 */

#ifndef SEGUE_PLAY_QUEUE_HH
#define SEGUE_PLAY_QUEUE_HH

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>
#include <segue/types.hh>
#include <segue/shuffle.hh>
#include <segue/export_segue.h>

namespace segue {

    /**
     * @class play_queue
     * @brief Ordered upcoming tracks split into two tiers
     *
     * @code
     * Explicit queue (user added, plays first):
     *   - Track B
     *   - Track C
     * Source queue (active album / playlist):
     *   - Track D
     *   - Track E
     * @endcode
     *
     * The combined view is the explicit queue followed by the source queue.
     * Indices passed to remove(), reorder() and skip_to() address that view.
     *
     * The queue also keeps the original (unshuffled) order of the source
     * tier. It is used to undo a shuffle and to refill the source tier when
     * repeat-all wraps around.
     */
    class SEGUE_EXPORT play_queue {
        public:
            play_queue() = default;

            /**
             * @brief Insert at the front of the explicit queue
             */
            void add_next(queue_track track);

            /**
             * @brief Insert at the back of the explicit queue
             */
            void add_to_end(queue_track track);

            /**
             * @brief Start a new context
             *
             * Clears the explicit queue, replaces the source tier and the
             * original order with @p tracks and shuffles the source tier
             * according to @p mode.
             */
            void load_source(std::vector <queue_track> tracks, shuffle_mode mode, random_engine_t& rng);

            /**
             * @brief Extend the current context
             *
             * The original order receives @p tracks as given; the source tier
             * receives a copy shuffled according to @p mode.
             */
            void append_source(std::vector <queue_track> tracks, shuffle_mode mode, random_engine_t& rng);

            /**
             * @brief Remove and return the next track (explicit tier first)
             */
            std::optional <queue_track> pop_next();

            /**
             * @brief The track pop_next() would return, or nullptr
             */
            [[nodiscard]] const queue_track* peek_next() const;

            /**
             * @brief Refill the source tier from the original order
             * @return false if there is no original order to refill from
             */
            bool reload_source(shuffle_mode mode, random_engine_t& rng);

            /**
             * @brief Remove the entry at a combined-view index
             * @return The removed track, or nothing if the index is out of range
             */
            std::optional <queue_track> remove(std::size_t index);

            /**
             * @brief Move an entry inside its tier
             * @return false if an index is out of range or the move crosses tiers
             */
            bool reorder(std::size_t from, std::size_t to);

            /**
             * @brief Drop every entry in front of a combined-view index
             *
             * Afterwards the entry formerly at @p index is the next track.
             * Skipping into the source tier empties the explicit tier.
             *
             * @return The dropped entries in play order, or nothing if the
             *         index is out of range
             */
            std::optional <std::vector <queue_track>> skip_to(std::size_t index);

            /**
             * @brief Empty both tiers and the original order
             */
            void clear();

            /**
             * @brief Reshuffle the source tier; the original order is kept
             */
            void shuffle_source(shuffle_mode mode, random_engine_t& rng);

            /**
             * @brief Record the current source tier as its original order
             */
            void snapshot_original_order();

            /**
             * @brief Replace the source tier with the original order
             */
            void restore_original_order();

            /**
             * @brief Snapshot of the combined view
             */
            [[nodiscard]] std::vector <queue_track> get_all() const;

            [[nodiscard]] const std::deque <queue_track>& explicit_tracks() const { return m_explicit; }
            [[nodiscard]] const std::deque <queue_track>& source_tracks() const { return m_source; }
            [[nodiscard]] const std::deque <queue_track>& original_order() const { return m_original; }

            [[nodiscard]] std::size_t size() const { return m_explicit.size() + m_source.size(); }
            [[nodiscard]] bool empty() const { return m_explicit.empty() && m_source.empty(); }

        private:
            std::deque <queue_track> m_explicit;
            std::deque <queue_track> m_source;
            std::deque <queue_track> m_original;
    };

} // namespace segue

#endif // SEGUE_PLAY_QUEUE_HH
