#ifndef SEGUE_TEST_FIXTURES_HH
#define SEGUE_TEST_FIXTURES_HH

#include <segue/transport.hh>
#include <segue/events.hh>
#include <segue/types.hh>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "mock_backends.hh"

namespace segue::test {

    inline queue_track make_track(const std::string& id,
                                  const std::string& artist = "Artist",
                                  const std::optional<std::string>& album = std::nullopt) {
        queue_track track;
        track.id = id;
        track.title = "Title " + id;
        track.artist = artist;
        track.album = album;
        track.path = "mem://" + id;
        track.duration = 200.0;
        track.source = {track_source::kind::playlist, "test", "Test playlist"};
        return track;
    }

    // t1 .. tN
    inline std::vector<queue_track> make_tracks(std::size_t count, const std::string& prefix = "t") {
        std::vector<queue_track> tracks;
        for (std::size_t i = 1; i <= count; i++) {
            tracks.push_back(make_track(prefix + std::to_string(i)));
        }
        return tracks;
    }

    inline std::vector<std::string> ids_of(const std::vector<queue_track>& tracks) {
        std::vector<std::string> ids;
        for (const auto& t : tracks) {
            ids.push_back(t.id);
        }
        return ids;
    }

    template <typename Container>
    std::vector<std::string> ids_of_range(const Container& tracks) {
        std::vector<std::string> ids;
        for (const auto& t : tracks) {
            ids.push_back(t.id);
        }
        return ids;
    }

    // Records every event a transport publishes, in order
    class event_recorder {
        public:
            explicit event_recorder(transport& player) {
                for (auto type : {event_type::state_changed, event_type::track_changed,
                                  event_type::track_finished, event_type::position_update,
                                  event_type::queue_changed, event_type::volume_changed,
                                  event_type::mute_changed, event_type::shuffle_changed,
                                  event_type::repeat_changed, event_type::error}) {
                    player.subscribe(type, [this](const playback_event& e) { events.push_back(e); });
                }
            }

            std::vector<playback_event> events;

            template <typename Event>
            std::vector<Event> all() const {
                std::vector<Event> result;
                for (const auto& e : events) {
                    if (const auto* ev = std::get_if<Event>(&e)) {
                        result.push_back(*ev);
                    }
                }
                return result;
            }

            template <typename Event>
            std::size_t count() const {
                return all<Event>().size();
            }

            std::vector<event_type> types() const {
                std::vector<event_type> result;
                for (const auto& e : events) {
                    result.push_back(type_of(e));
                }
                return result;
            }

            std::vector<playback_state> states() const {
                std::vector<playback_state> result;
                for (const auto& e : all<state_changed_event>()) {
                    result.push_back(e.state);
                }
                return result;
            }

            void clear() { events.clear(); }
    };

    // Transport over a mock backend whose state the test can inspect
    struct transport_fixture {
        explicit transport_fixture(playback_config config = make_config())
            : backend(std::make_shared<mock_backend_state>()),
              player(create_mock_backend(backend), config) {}

        static playback_config make_config() {
            playback_config config;
            config.shuffle_seed = 42;
            return config;
        }

        std::shared_ptr<mock_backend_state> backend;
        transport player;
    };

} // namespace segue::test

#endif // SEGUE_TEST_FIXTURES_HH
