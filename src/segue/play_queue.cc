#include <segue/play_queue.hh>
#include <algorithm>
#include <iterator>
#include <utility>

#include <failsafe/failsafe.hh>

namespace segue {
    namespace {
        using diff_t = std::deque <queue_track>::difference_type;

        void move_within(std::deque <queue_track>& tier, std::size_t from, std::size_t to) {
            auto track = std::move(tier[from]);
            tier.erase(tier.begin() + static_cast <diff_t>(from));
            tier.insert(tier.begin() + static_cast <diff_t>(to), std::move(track));
        }
    }

    void play_queue::add_next(queue_track track) {
        m_explicit.emplace_front(std::move(track));
    }

    void play_queue::add_to_end(queue_track track) {
        m_explicit.emplace_back(std::move(track));
    }

    void play_queue::load_source(std::vector <queue_track> tracks, shuffle_mode mode, random_engine_t& rng) {
        m_explicit.clear();
        m_original.assign(tracks.begin(), tracks.end());
        m_source.assign(std::make_move_iterator(tracks.begin()), std::make_move_iterator(tracks.end()));
        if (mode != shuffle_mode::off) {
            shuffle_tracks(m_source, mode, rng);
        }
        if (const auto removed = remove_consecutive_duplicates(m_source); removed > 0) {
            LOG_DEBUG("play_queue", "Collapsed", removed, "repeated entries in new context");
        }
    }

    void play_queue::append_source(std::vector <queue_track> tracks, shuffle_mode mode, random_engine_t& rng) {
        m_original.insert(m_original.end(), tracks.begin(), tracks.end());

        std::deque <queue_track> added(std::make_move_iterator(tracks.begin()), std::make_move_iterator(tracks.end()));
        if (mode != shuffle_mode::off) {
            shuffle_tracks(added, mode, rng);
        }
        m_source.insert(m_source.end(), std::make_move_iterator(added.begin()), std::make_move_iterator(added.end()));
        remove_consecutive_duplicates(m_source);
    }

    std::optional <queue_track> play_queue::pop_next() {
        auto& tier = m_explicit.empty() ? m_source : m_explicit;
        if (tier.empty()) {
            return std::nullopt;
        }
        auto track = std::move(tier.front());
        tier.pop_front();
        return track;
    }

    const queue_track* play_queue::peek_next() const {
        if (!m_explicit.empty()) {
            return &m_explicit.front();
        }
        if (!m_source.empty()) {
            return &m_source.front();
        }
        return nullptr;
    }

    bool play_queue::reload_source(shuffle_mode mode, random_engine_t& rng) {
        if (m_original.empty()) {
            return false;
        }
        m_source = m_original;
        if (mode != shuffle_mode::off) {
            shuffle_tracks(m_source, mode, rng);
            remove_consecutive_duplicates(m_source);
        }
        return true;
    }

    std::optional <queue_track> play_queue::remove(std::size_t index) {
        if (index >= size()) {
            return std::nullopt;
        }

        if (index < m_explicit.size()) {
            auto track = std::move(m_explicit[index]);
            m_explicit.erase(m_explicit.begin() + static_cast <diff_t>(index));
            return track;
        }

        const auto source_index = index - m_explicit.size();
        auto track = std::move(m_source[source_index]);
        m_source.erase(m_source.begin() + static_cast <diff_t>(source_index));

        // keep the original order consistent so a later restore does not resurrect it
        auto it = std::find_if(m_original.begin(), m_original.end(),
                               [&track](const queue_track& t) { return t.id == track.id; });
        if (it != m_original.end()) {
            m_original.erase(it);
        }
        return track;
    }

    bool play_queue::reorder(std::size_t from, std::size_t to) {
        const auto total = size();
        if (from >= total || to >= total) {
            return false;
        }
        if (from == to) {
            return true;
        }

        const auto explicit_len = m_explicit.size();
        if (from < explicit_len && to < explicit_len) {
            move_within(m_explicit, from, to);
            return true;
        }
        if (from >= explicit_len && to >= explicit_len) {
            move_within(m_source, from - explicit_len, to - explicit_len);
            return true;
        }

        LOG_WARN("play_queue", "Refusing to move entry", from, "to", to, "across queue tiers");
        return false;
    }

    std::optional <std::vector <queue_track>> play_queue::skip_to(std::size_t index) {
        if (index >= size()) {
            return std::nullopt;
        }

        std::vector <queue_track> skipped;
        const auto explicit_len = m_explicit.size();
        if (index < explicit_len) {
            const auto end = m_explicit.begin() + static_cast <diff_t>(index);
            skipped.assign(std::make_move_iterator(m_explicit.begin()), std::make_move_iterator(end));
            m_explicit.erase(m_explicit.begin(), end);
            return skipped;
        }

        skipped.assign(std::make_move_iterator(m_explicit.begin()), std::make_move_iterator(m_explicit.end()));
        m_explicit.clear();

        const auto end = m_source.begin() + static_cast <diff_t>(index - explicit_len);
        skipped.insert(skipped.end(), std::make_move_iterator(m_source.begin()), std::make_move_iterator(end));
        m_source.erase(m_source.begin(), end);
        return skipped;
    }

    void play_queue::clear() {
        m_explicit.clear();
        m_source.clear();
        m_original.clear();
    }

    void play_queue::shuffle_source(shuffle_mode mode, random_engine_t& rng) {
        shuffle_tracks(m_source, mode, rng);
        remove_consecutive_duplicates(m_source);
    }

    void play_queue::snapshot_original_order() {
        m_original = m_source;
    }

    void play_queue::restore_original_order() {
        m_source = m_original;
    }

    std::vector <queue_track> play_queue::get_all() const {
        std::vector <queue_track> all;
        all.reserve(size());
        all.insert(all.end(), m_explicit.begin(), m_explicit.end());
        all.insert(all.end(), m_source.begin(), m_source.end());
        return all;
    }
}
