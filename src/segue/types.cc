#include <segue/types.hh>

namespace segue {
    const char* to_string(playback_state state) {
        switch (state) {
            case playback_state::stopped: return "stopped";
            case playback_state::loading: return "loading";
            case playback_state::playing: return "playing";
            case playback_state::paused: return "paused";
        }
        return "unknown";
    }

    const char* to_string(shuffle_mode mode) {
        switch (mode) {
            case shuffle_mode::off: return "off";
            case shuffle_mode::random: return "random";
            case shuffle_mode::smart: return "smart";
        }
        return "unknown";
    }

    const char* to_string(repeat_mode mode) {
        switch (mode) {
            case repeat_mode::off: return "off";
            case repeat_mode::all: return "all";
            case repeat_mode::one: return "one";
        }
        return "unknown";
    }

    std::optional <shuffle_mode> parse_shuffle_mode(std::string_view name) {
        if (name == "off") {
            return shuffle_mode::off;
        }
        if (name == "random") {
            return shuffle_mode::random;
        }
        if (name == "smart") {
            return shuffle_mode::smart;
        }
        return std::nullopt;
    }

    std::optional <repeat_mode> parse_repeat_mode(std::string_view name) {
        if (name == "off") {
            return repeat_mode::off;
        }
        if (name == "all") {
            return repeat_mode::all;
        }
        if (name == "one") {
            return repeat_mode::one;
        }
        return std::nullopt;
    }
}
