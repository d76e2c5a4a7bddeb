#include <segue/shuffle.hh>
#include <algorithm>
#include <iterator>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace segue {
    namespace {
        // Round-robin over the albums of one artist so that consecutive picks
        // from this artist come from different records when possible.
        std::deque <queue_track> spread_albums(std::vector <queue_track>&& tracks, random_engine_t& rng) {
            std::map <std::string, std::vector <queue_track>> by_album;
            for (auto& track : tracks) {
                by_album[track.album.value_or(std::string{})].emplace_back(std::move(track));
            }

            std::vector <std::vector <queue_track>> albums;
            albums.reserve(by_album.size());
            for (auto& [name, album_tracks] : by_album) {
                std::shuffle(album_tracks.begin(), album_tracks.end(), rng);
                albums.emplace_back(std::move(album_tracks));
            }
            std::shuffle(albums.begin(), albums.end(), rng);

            std::deque <queue_track> result;
            for (std::size_t round = 0;; ++round) {
                bool placed = false;
                for (auto& album : albums) {
                    if (round < album.size()) {
                        result.emplace_back(std::move(album[round]));
                        placed = true;
                    }
                }
                if (!placed) {
                    break;
                }
            }
            return result;
        }
    }

    void shuffle_tracks(std::deque <queue_track>& tracks, shuffle_mode mode, random_engine_t& rng) {
        switch (mode) {
            case shuffle_mode::off:
                break;
            case shuffle_mode::random:
                shuffle_random(tracks, rng);
                break;
            case shuffle_mode::smart:
                shuffle_smart(tracks, rng);
                break;
        }
    }

    void shuffle_random(std::deque <queue_track>& tracks, random_engine_t& rng) {
        if (tracks.size() < 2) {
            return;
        }
        for (std::size_t i = tracks.size() - 1; i > 0; --i) {
            std::uniform_int_distribution <std::size_t> pick(0, i);
            const auto j = pick(rng);
            if (i != j) {
                std::swap(tracks[i], tracks[j]);
            }
        }
    }

    void shuffle_smart(std::deque <queue_track>& tracks, random_engine_t& rng) {
        if (tracks.size() <= 2) {
            shuffle_random(tracks, rng);
            return;
        }

        std::map <std::string, std::vector <queue_track>> by_artist;
        for (auto& track : tracks) {
            by_artist[track.artist].emplace_back(std::move(track));
        }

        std::vector <std::deque <queue_track>> groups;
        groups.reserve(by_artist.size());
        for (auto& [artist, artist_tracks] : by_artist) {
            groups.emplace_back(spread_albums(std::move(artist_tracks), rng));
        }
        // group order decides ties below
        std::shuffle(groups.begin(), groups.end(), rng);

        const auto total = tracks.size();
        tracks.clear();

        constexpr std::size_t none = static_cast <std::size_t>(-1);
        std::size_t last = none;
        while (tracks.size() < total) {
            std::size_t best = none;
            for (std::size_t g = 0; g < groups.size(); ++g) {
                if (g == last || groups[g].empty()) {
                    continue;
                }
                if (best == none || groups[g].size() > groups[best].size()) {
                    best = g;
                }
            }
            if (best == none) {
                // only the previous artist has tracks left
                best = last;
            }
            tracks.emplace_back(std::move(groups[best].front()));
            groups[best].pop_front();
            last = best;
        }
    }

    std::size_t remove_consecutive_duplicates(std::deque <queue_track>& tracks) {
        if (tracks.size() < 2) {
            return 0;
        }
        const auto new_end = std::unique(tracks.begin(), tracks.end(),
                                         [](const queue_track& a, const queue_track& b) {
                                             return a.id == b.id;
                                         });
        const auto removed = static_cast <std::size_t>(std::distance(new_end, tracks.end()));
        tracks.erase(new_end, tracks.end());
        return removed;
    }
}
