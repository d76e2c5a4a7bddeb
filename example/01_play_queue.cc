/**
 * @example 01_play_queue.cc
 * @brief Basic example: Playing a list of files through the transport
 *
 * This example builds a context from the files given on the command line
 * and plays it to completion on the silent Null backend, printing the
 * transport events as they happen. The simulated clock runs as fast as
 * the loop can drain the dispatcher.
 */

#include <segue/transport.hh>
#include <segue/backends/null/null_backend.hh>
#include <segue/callback_dispatcher.hh>
#include <segue/error.hh>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <filesystem>

namespace {
    void usage(const char* prog) {
        std::cerr << "Usage: " << prog << " [options] <file>...\n";
        std::cerr << "Options:\n";
        std::cerr << "  --shuffle <off|random|smart>\n";
        std::cerr << "  --repeat <off|all|one>\n";
        std::cerr << "  --volume <0-100>\n";
        std::cerr << "  --history <entries>\n";
        std::cerr << "  --seed <number>\n";
    }

    segue::queue_track make_track(const std::string& path, std::size_t index) {
        std::filesystem::path p(path);
        segue::queue_track track;
        track.id = std::to_string(index) + ":" + p.filename().string();
        track.title = p.stem().string();
        track.artist = p.has_parent_path() ? p.parent_path().filename().string() : std::string("Unknown Artist");
        track.path = path;
        track.track_number = static_cast <uint32_t>(index + 1);
        track.source = {segue::track_source::kind::playlist, "cli", "Command line"};
        return track;
    }
}

int main(int argc, char* argv[]) {
    segue::playback_config config;
    std::vector <segue::queue_track> tracks;

    try {
        for (int i = 1; i < argc; i++) {
            std::string_view arg = argv[i];
            const bool has_value = i + 1 < argc;
            if (arg == "--shuffle" && has_value) {
                auto mode = segue::parse_shuffle_mode(argv[++i]);
                if (!mode) {
                    std::cerr << "Unknown shuffle mode: " << argv[i] << '\n';
                    return 1;
                }
                config.shuffle = *mode;
            } else if (arg == "--repeat" && has_value) {
                auto mode = segue::parse_repeat_mode(argv[++i]);
                if (!mode) {
                    std::cerr << "Unknown repeat mode: " << argv[i] << '\n';
                    return 1;
                }
                config.repeat = *mode;
            } else if (arg == "--volume" && has_value) {
                const int level = std::stoi(argv[++i]);
                if (level < 0 || level > 100) {
                    std::cerr << "Volume out of range: " << argv[i] << '\n';
                    return 1;
                }
                config.volume = static_cast <segue::volume_level_t>(level);
            } else if (arg == "--history" && has_value) {
                config.history_size = std::stoul(argv[++i]);
            } else if (arg == "--seed" && has_value) {
                config.shuffle_seed = static_cast <uint32_t>(std::stoul(argv[++i]));
            } else if (arg.size() > 1 && arg[0] == '-') {
                usage(argv[0]);
                return 1;
            } else {
                tracks.push_back(make_track(std::string(arg), tracks.size()));
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Bad argument: " << e.what() << '\n';
        usage(argv[0]);
        return 1;
    }

    if (tracks.empty()) {
        usage(argv[0]);
        return 1;
    }

    try {
        segue::callback_dispatcher dispatcher;
        auto backend = std::make_unique <segue::null_backend>(dispatcher);
        auto* clock = backend.get();
        segue::transport player(std::move(backend), config);

        // Under repeat the context never runs out; stop after two passes
        const std::size_t max_tracks = config.repeat == segue::repeat_mode::off ? tracks.size() : tracks.size() * 2;
        std::size_t started = 0;
        std::size_t finished = 0;

        player.subscribe <segue::track_changed_event>([&](const segue::track_changed_event& e) {
            if (e.track) {
                started++;
                std::cout << "Now playing: " << e.track->title << " (" << e.track->artist << ")\n";
            }
        });
        player.subscribe <segue::track_finished_event>([&](const segue::track_finished_event& e) {
            std::cout << "Finished: " << e.track_id << '\n';
            if (++finished >= max_tracks) {
                player.stop();
            }
        });
        player.subscribe <segue::error_event>([](const segue::error_event& e) {
            std::cerr << "Error: " << e.message << '\n';
        });
        player.subscribe <segue::state_changed_event>([](const segue::state_changed_event& e) {
            std::cout << "State: " << e.state << '\n';
        });

        player.load_playlist(tracks);
        std::cout << "Queued " << player.queue_length() << " tracks, shuffle " << player.get_shuffle()
            << ", repeat " << player.get_repeat() << ", volume " << player.get_volume() << '\n';
        player.play();

        // A failed load leaves the transport stopped; carry on with the rest
        do {
            dispatcher.dispatch();
            if (player.get_state() == segue::playback_state::stopped && player.has_next() && started < max_tracks && finished < max_tracks) {
                player.play();
            }
            clock->advance(10.0);
        } while (player.get_state() != segue::playback_state::stopped || dispatcher.pending() > 0);

        std::cout << "Played " << started << " tracks\n";
    } catch (const segue::segue_error& e) {
        std::cerr << "Playback error: " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
