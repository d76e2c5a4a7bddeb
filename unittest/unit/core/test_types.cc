#include <doctest/doctest.h>
#include <segue/types.hh>
#include <sstream>
#include <string>

using namespace segue;

TEST_SUITE("Core::Types") {
    TEST_CASE("mode names round trip") {
        for (auto mode : {shuffle_mode::off, shuffle_mode::random, shuffle_mode::smart}) {
            CHECK(parse_shuffle_mode(to_string(mode)) == mode);
        }
        for (auto mode : {repeat_mode::off, repeat_mode::all, repeat_mode::one}) {
            CHECK(parse_repeat_mode(to_string(mode)) == mode);
        }
        CHECK_FALSE(parse_shuffle_mode("sideways").has_value());
        CHECK_FALSE(parse_repeat_mode("").has_value());
    }

    TEST_CASE("config defaults") {
        playback_config config;
        CHECK(config.volume == 80);
        CHECK(config.shuffle == shuffle_mode::off);
        CHECK(config.repeat == repeat_mode::off);
        CHECK(config.history_size == 50);
        CHECK_FALSE(config.shuffle_seed.has_value());
    }

    TEST_CASE("tracks compare by value") {
        queue_track a;
        a.id = "a";
        a.path = "/music/a.flac";
        queue_track b = a;
        CHECK(a == b);

        b.album = "Album";
        CHECK(a != b);

        std::ostringstream os;
        os << a << ' ' << playback_state::paused;
        CHECK(os.str().find("id=\"a\"") != std::string::npos);
        CHECK(os.str().find("paused") != std::string::npos);
    }
}
