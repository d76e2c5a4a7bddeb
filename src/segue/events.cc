#include <segue/events.hh>
#include <type_traits>

namespace segue {
    event_type type_of(const playback_event& event) {
        return std::visit([](const auto& ev) { return std::decay_t <decltype(ev)>::type; }, event);
    }

    const char* to_string(event_type type) {
        switch (type) {
            case event_type::state_changed: return "state_changed";
            case event_type::track_changed: return "track_changed";
            case event_type::track_finished: return "track_finished";
            case event_type::position_update: return "position_update";
            case event_type::queue_changed: return "queue_changed";
            case event_type::volume_changed: return "volume_changed";
            case event_type::mute_changed: return "mute_changed";
            case event_type::shuffle_changed: return "shuffle_changed";
            case event_type::repeat_changed: return "repeat_changed";
            case event_type::error: return "error";
        }
        return "unknown";
    }
}
