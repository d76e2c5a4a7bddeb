/**
 * @file types.hh
 * @brief Track, mode and configuration types shared by all segue modules
 * @ingroup core
 */

#ifndef SEGUE_TYPES_HH
#define SEGUE_TYPES_HH

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <segue/export_segue.h>

namespace segue {

/**
 * @brief Percent scale used for user-facing volume (0..100)
 */
using volume_level_t = unsigned int;

/**
 * @struct track_source
 * @brief Browsing context a track was queued from
 *
 * Identifies the album, playlist or artist page that seeded the source
 * queue. Tracks added individually carry the `single` kind.
 */
struct track_source {
    enum class kind {
        single,
        album,
        playlist,
        artist
    };

    kind type = kind::single;
    std::string id;    ///< Context identifier, empty for single tracks
    std::string name;  ///< Display name of the context

    bool operator==(const track_source& other) const {
        return type == other.type && id == other.id && name == other.name;
    }

    bool operator!=(const track_source& other) const {
        return !(*this == other);
    }
};

/**
 * @struct queue_track
 * @brief A playable item held by the queue and the history
 *
 * Queue entries are value copies; nothing in segue mutates a track after it
 * was handed in.
 */
struct queue_track {
    std::string id;                         ///< Unique track identifier
    std::string title;                      ///< Track title
    std::string artist;                     ///< Artist name
    std::optional<std::string> album;       ///< Album name, if known
    std::string path;                       ///< Resource locator handed to the backend
    double duration = 0.0;                  ///< Seconds, 0 when unknown until loaded
    std::optional<uint32_t> track_number;   ///< Position on the album, if known
    track_source source;                    ///< Context the track was queued from

    bool operator==(const queue_track& other) const {
        return id == other.id && title == other.title && artist == other.artist &&
               album == other.album && path == other.path && duration == other.duration &&
               track_number == other.track_number && source == other.source;
    }

    bool operator!=(const queue_track& other) const {
        return !(*this == other);
    }
};

/**
 * @enum playback_state
 * @brief Transport state; exactly one value at any time
 */
enum class playback_state {
    stopped,
    loading,
    playing,
    paused
};

/**
 * @enum shuffle_mode
 * @brief How the source queue is reordered
 */
enum class shuffle_mode {
    off,     ///< Context order
    random,  ///< Unbiased Fisher-Yates
    smart    ///< Spread artists and albums
};

/**
 * @enum repeat_mode
 * @brief What happens when the queue runs out
 */
enum class repeat_mode {
    off,  ///< Stop at the end of the queue
    all,  ///< Wrap around to the start of the context
    one   ///< Restart the current track forever
};

/**
 * @struct playback_config
 * @brief Session defaults supplied by the host application
 *
 * segue reads and writes no settings storage itself; the host loads these
 * values from wherever it keeps them and passes them to the transport.
 */
struct playback_config {
    volume_level_t volume = 80;               ///< Initial volume (0-100)
    shuffle_mode shuffle = shuffle_mode::off; ///< Initial shuffle mode
    repeat_mode repeat = repeat_mode::off;    ///< Initial repeat mode
    std::size_t history_size = 50;            ///< Maximum history entries
    std::optional<uint32_t> shuffle_seed;     ///< Fixed seed for reproducible shuffles
};

SEGUE_EXPORT const char* to_string(playback_state state);
SEGUE_EXPORT const char* to_string(shuffle_mode mode);
SEGUE_EXPORT const char* to_string(repeat_mode mode);

/**
 * @brief Parse a shuffle mode name ("off", "random", "smart")
 * @return The mode, or nothing if the name is not recognized
 */
SEGUE_EXPORT std::optional<shuffle_mode> parse_shuffle_mode(std::string_view name);

/**
 * @brief Parse a repeat mode name ("off", "all", "one")
 * @return The mode, or nothing if the name is not recognized
 */
SEGUE_EXPORT std::optional<repeat_mode> parse_repeat_mode(std::string_view name);

inline std::ostream& operator<<(std::ostream& os, playback_state state) {
    return os << to_string(state);
}

inline std::ostream& operator<<(std::ostream& os, shuffle_mode mode) {
    return os << to_string(mode);
}

inline std::ostream& operator<<(std::ostream& os, repeat_mode mode) {
    return os << to_string(mode);
}

/**
 * @brief Stream output operator for queue_track
 *
 * Formats a track for debugging output.
 */
inline std::ostream& operator<<(std::ostream& os, const queue_track& track) {
    os << "queue_track{"
       << "id=\"" << track.id << "\", "
       << "title=\"" << track.title << "\", "
       << "artist=\"" << track.artist << "\", "
       << "path=\"" << track.path << "\", "
       << "duration=" << track.duration
       << "}";
    return os;
}

} // namespace segue

#endif // SEGUE_TYPES_HH
