/**
 * @file play_history.hh
 * @brief Bounded history of played tracks
 * @ingroup core
 */

#ifndef SEGUE_PLAY_HISTORY_HH
#define SEGUE_PLAY_HISTORY_HH

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>
#include <segue/types.hh>
#include <segue/export_segue.h>

namespace segue {

    /**
     * @class play_history
     * @brief Ring buffer of previously played tracks, most recent at the back
     *
     * When the history is full, pushing a track evicts the oldest entry.
     * A capacity of zero disables the history.
     */
    class SEGUE_EXPORT play_history {
        public:
            explicit play_history(std::size_t max_size = 50);

            void push(queue_track track);

            /**
             * @brief Remove and return the most recent entry
             */
            std::optional <queue_track> pop();

            [[nodiscard]] const queue_track* peek() const;

            /**
             * @brief Snapshot of all entries, oldest first
             */
            [[nodiscard]] std::vector <queue_track> get_all() const;

            [[nodiscard]] std::size_t size() const { return m_tracks.size(); }
            [[nodiscard]] bool empty() const { return m_tracks.empty(); }
            void clear();

            [[nodiscard]] std::size_t max_size() const { return m_max_size; }

            /**
             * @brief Change the capacity, discarding the oldest entries if it shrinks
             */
            void set_max_size(std::size_t max_size);

        private:
            void trim();

            std::deque <queue_track> m_tracks;
            std::size_t m_max_size;
    };

} // namespace segue

#endif // SEGUE_PLAY_HISTORY_HH
