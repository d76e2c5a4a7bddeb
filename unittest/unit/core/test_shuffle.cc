#include <doctest/doctest.h>
#include <segue/shuffle.hh>
#include "../../test_fixtures.hh"
#include <algorithm>
#include <deque>
#include <string>
#include <vector>

using namespace segue;
using namespace segue::test;

namespace {
    std::deque<queue_track> as_deque(const std::vector<queue_track>& tracks) {
        return {tracks.begin(), tracks.end()};
    }

    std::vector<std::string> sorted_ids(const std::deque<queue_track>& tracks) {
        auto ids = ids_of_range(tracks);
        std::sort(ids.begin(), ids.end());
        return ids;
    }

    std::size_t adjacent_same_artist(const std::deque<queue_track>& tracks) {
        std::size_t n = 0;
        for (std::size_t i = 1; i < tracks.size(); i++) {
            if (tracks[i].artist == tracks[i - 1].artist) {
                n++;
            }
        }
        return n;
    }
}

TEST_SUITE("Shuffle::Random") {
    TEST_CASE("is a permutation") {
        random_engine_t rng(11);
        auto tracks = as_deque(make_tracks(30));
        const auto before = sorted_ids(tracks);

        shuffle_random(tracks, rng);

        CHECK(tracks.size() == 30);
        CHECK(sorted_ids(tracks) == before);
    }

    TEST_CASE("same seed gives the same order") {
        auto a = as_deque(make_tracks(15));
        auto b = a;
        random_engine_t rng_a(99);
        random_engine_t rng_b(99);

        shuffle_tracks(a, shuffle_mode::random, rng_a);
        shuffle_tracks(b, shuffle_mode::random, rng_b);

        CHECK(ids_of_range(a) == ids_of_range(b));
    }

    TEST_CASE("small inputs and off mode are left alone") {
        random_engine_t rng(1);
        std::deque<queue_track> empty;
        shuffle_random(empty, rng);
        CHECK(empty.empty());

        auto one = as_deque(make_tracks(1));
        shuffle_random(one, rng);
        CHECK(one.front().id == "t1");

        auto tracks = as_deque(make_tracks(5));
        shuffle_tracks(tracks, shuffle_mode::off, rng);
        CHECK(ids_of_range(tracks) == std::vector<std::string>{"t1", "t2", "t3", "t4", "t5"});
    }
}

TEST_SUITE("Shuffle::Smart") {
    TEST_CASE("spreads artists apart when possible") {
        std::deque<queue_track> tracks;
        for (int i = 0; i < 4; i++) {
            tracks.push_back(make_track("a" + std::to_string(i), "Alpha"));
            tracks.push_back(make_track("b" + std::to_string(i), "Beta"));
            tracks.push_back(make_track("c" + std::to_string(i), "Gamma"));
        }
        // worst case input: grouped by artist
        std::stable_sort(tracks.begin(), tracks.end(),
                         [](const queue_track& x, const queue_track& y) { return x.artist < y.artist; });
        const auto before = sorted_ids(tracks);

        for (uint32_t seed = 0; seed < 10; seed++) {
            auto copy = tracks;
            random_engine_t rng(seed);
            shuffle_smart(copy, rng);
            CHECK(sorted_ids(copy) == before);
            CHECK(adjacent_same_artist(copy) == 0);
        }
    }

    TEST_CASE("dominant artist still yields a full permutation") {
        std::deque<queue_track> tracks;
        for (int i = 0; i < 6; i++) {
            tracks.push_back(make_track("a" + std::to_string(i), "Alpha"));
        }
        tracks.push_back(make_track("b0", "Beta"));
        const auto before = sorted_ids(tracks);

        random_engine_t rng(5);
        shuffle_smart(tracks, rng);

        CHECK(sorted_ids(tracks) == before);
        // Alpha opens because it has the most tracks left
        CHECK(tracks.front().artist == "Alpha");
    }

    TEST_CASE("albums of one artist alternate") {
        std::deque<queue_track> tracks;
        for (int i = 0; i < 3; i++) {
            tracks.push_back(make_track("x" + std::to_string(i), "Solo", std::string("First")));
            tracks.push_back(make_track("y" + std::to_string(i), "Solo", std::string("Second")));
        }
        random_engine_t rng(2);
        shuffle_smart(tracks, rng);

        REQUIRE(tracks.size() == 6);
        for (std::size_t i = 1; i < tracks.size(); i++) {
            CHECK(tracks[i].album != tracks[i - 1].album);
        }
    }
}

TEST_SUITE("Shuffle::Duplicates") {
    TEST_CASE("only adjacent repeats are removed") {
        std::deque<queue_track> tracks{make_track("a"), make_track("a"), make_track("a"),
                                       make_track("b"), make_track("a"), make_track("b"), make_track("b")};
        CHECK(remove_consecutive_duplicates(tracks) == 3);
        CHECK(ids_of_range(tracks) == std::vector<std::string>{"a", "b", "a", "b"});
    }
}
