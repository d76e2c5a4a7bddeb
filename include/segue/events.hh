/**
 * @file events.hh
 * @brief Events published by the transport
 * @ingroup events
 */

#ifndef SEGUE_EVENTS_HH
#define SEGUE_EVENTS_HH

#include <cstddef>
#include <exception>
#include <optional>
#include <string>
#include <variant>
#include <segue/types.hh>
#include <segue/export_segue.h>

namespace segue {

/**
 * @enum event_type
 * @brief Subscription key; one value per event struct
 */
enum class event_type {
    state_changed,
    track_changed,
    track_finished,
    position_update,
    queue_changed,
    volume_changed,
    mute_changed,
    shuffle_changed,
    repeat_changed,
    error
};

/// Playback state changed
struct state_changed_event {
    static constexpr event_type type = event_type::state_changed;
    playback_state state;
};

/// A new track became current; `track` is empty after stop()
struct track_changed_event {
    static constexpr event_type type = event_type::track_changed;
    std::optional<queue_track> track;
    std::optional<std::string> previous_track_id;
};

/// The backend reported the natural end of a track
struct track_finished_event {
    static constexpr event_type type = event_type::track_finished;
    std::string track_id;
};

/// Periodic position tick forwarded from the backend
struct position_update_event {
    static constexpr event_type type = event_type::position_update;
    double position;  ///< Seconds
    double duration;  ///< Seconds, 0 when unknown
};

/// Tracks were added, removed, reordered or consumed
struct queue_changed_event {
    static constexpr event_type type = event_type::queue_changed;
    std::size_t length;
};

struct volume_changed_event {
    static constexpr event_type type = event_type::volume_changed;
    volume_level_t level;
};

struct mute_changed_event {
    static constexpr event_type type = event_type::mute_changed;
    bool muted;
};

struct shuffle_changed_event {
    static constexpr event_type type = event_type::shuffle_changed;
    shuffle_mode mode;
};

struct repeat_changed_event {
    static constexpr event_type type = event_type::repeat_changed;
    repeat_mode mode;
};

/// A backend operation failed; `cause` holds the original exception
struct error_event {
    static constexpr event_type type = event_type::error;
    std::string message;
    std::exception_ptr cause;
};

using playback_event = std::variant<
    state_changed_event,
    track_changed_event,
    track_finished_event,
    position_update_event,
    queue_changed_event,
    volume_changed_event,
    mute_changed_event,
    shuffle_changed_event,
    repeat_changed_event,
    error_event>;

/**
 * @brief Subscription key of an event value
 */
SEGUE_EXPORT event_type type_of(const playback_event& event);

SEGUE_EXPORT const char* to_string(event_type type);

} // namespace segue

#endif // SEGUE_EVENTS_HH
