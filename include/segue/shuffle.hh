/**
 * @file shuffle.hh
 * @brief Queue randomization algorithms
 * @ingroup core
 */

#ifndef SEGUE_SHUFFLE_HH
#define SEGUE_SHUFFLE_HH

#include <cstddef>
#include <deque>
#include <random>
#include <segue/types.hh>
#include <segue/export_segue.h>

namespace segue {

/**
 * @brief Random engine used by every shuffle in segue
 */
using random_engine_t = std::mt19937;

/**
 * @brief Reorder tracks in place according to a shuffle mode
 *
 * - shuffle_mode::off leaves the order untouched
 * - shuffle_mode::random applies shuffle_random()
 * - shuffle_mode::smart applies shuffle_smart()
 */
SEGUE_EXPORT void shuffle_tracks(std::deque<queue_track>& tracks, shuffle_mode mode, random_engine_t& rng);

/**
 * @brief Unbiased Fisher-Yates shuffle
 *
 * Walks from the last index down to 1 and swaps each slot with a uniformly
 * chosen index in [0, i].
 */
SEGUE_EXPORT void shuffle_random(std::deque<queue_track>& tracks, random_engine_t& rng);

/**
 * @brief Artist and album aware shuffle
 *
 * Tracks are grouped by artist. Inside a group, albums are interleaved so
 * that songs from one album do not cluster. The result is then assembled by
 * repeatedly taking a track from the artist with the most tracks left that
 * differs from the artist placed last. Two neighbours share an artist only
 * when one artist owns more than half of the tracks.
 *
 * Fewer than three tracks fall back to shuffle_random().
 */
SEGUE_EXPORT void shuffle_smart(std::deque<queue_track>& tracks, random_engine_t& rng);

/**
 * @brief Collapse runs of adjacent entries that share a track id
 * @return Number of removed entries
 */
SEGUE_EXPORT std::size_t remove_consecutive_duplicates(std::deque<queue_track>& tracks);

} // namespace segue

#endif // SEGUE_SHUFFLE_HH
