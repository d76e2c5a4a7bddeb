// This is copyrighted software. More information is at the end of this file.
#include <algorithm>
#include <cstdint>
#include <exception>
#include <random>
#include <string>
#include <utility>

#include <segue/transport.hh>
#include <segue/play_queue.hh>
#include <segue/play_history.hh>
#include <segue/shuffle.hh>
#include <segue/volume_control.hh>
#include <failsafe/failsafe.hh>

namespace segue {
    namespace {
        // previous() restarts the current track instead of going back once
        // playback is past this point
        constexpr double restart_threshold_seconds = 3.0;

        std::string describe(const std::exception_ptr& err) {
            if (!err) {
                return "unknown error";
            }
            try {
                std::rethrow_exception(err);
            } catch (const std::exception& e) {
                return e.what();
            } catch (...) {
                return "unknown error";
            }
        }

        random_engine_t make_engine(const playback_config& config) {
            if (config.shuffle_seed) {
                return random_engine_t(*config.shuffle_seed);
            }
            std::random_device rd;
            return random_engine_t(rd());
        }
    }

    struct transport::impl final {
        impl(std::unique_ptr <audio_backend> backend, const playback_config& config);

        std::unique_ptr <audio_backend> m_backend;
        play_queue m_queue;
        play_history m_history;
        volume_control m_volume;
        shuffle_mode m_shuffle;
        repeat_mode m_repeat;
        playback_state m_state = playback_state::stopped;
        std::optional <queue_track> m_current;
        random_engine_t m_rng;
        event_bus m_events;

        // Bumped by every load and by stop(); completions carrying an older
        // value belong to a superseded request.
        uint64_t m_load_generation = 0;

        // Lifetime token for callbacks that may outlive the transport
        std::shared_ptr <void> m_lifetime_token;

        void attach_backend();
        void shutdown();

        void set_state(playback_state state);
        void emit_queue_changed();

        void stop();
        void advance();
        void resolve_next();
        void restart_current();
        void begin_load(queue_track track);
        void on_load_complete(uint64_t generation, const std::exception_ptr& err);

        void on_ended();
        void on_time_update(double position);

        // Load/play failures: the track cannot play, go to stopped.
        void fail_playback(const std::string& context, const std::exception_ptr& err);
        // Failures of auxiliary operations (seek, volume, pause): report only.
        void report(const std::string& context, const std::exception_ptr& err);

        template <typename Op>
        bool guarded(const char* what, Op&& op) {
            try {
                op();
                return true;
            } catch (...) {
                report(what, std::current_exception());
                return false;
            }
        }
    };

    // ==============================================================================================================

    transport::impl::impl(std::unique_ptr <audio_backend> backend, const playback_config& config)
        : m_backend(std::move(backend)),
          m_history(config.history_size),
          m_volume(config.volume),
          m_shuffle(config.shuffle),
          m_repeat(config.repeat),
          m_rng(make_engine(config)),
          m_lifetime_token(std::make_shared <int>(1)) {
        if (config.volume > volume_control::max_level) {
            LOG_WARN("transport", "Configured volume", config.volume, "clamped to", m_volume.level());
        }
    }

    void transport::impl::attach_backend() {
        std::weak_ptr <void> alive = m_lifetime_token;
        m_backend->set_ended_callback([this, alive]() {
            if (!alive.expired()) {
                on_ended();
            }
        });
        m_backend->set_time_update_callback([this, alive](double position) {
            if (!alive.expired()) {
                on_time_update(position);
            }
        });
        m_backend->set_error_callback([this, alive](std::exception_ptr err) {
            if (!alive.expired()) {
                fail_playback("Audio backend error", err);
            }
        });
        guarded("Failed to apply initial volume", [this]() {
            m_backend->set_volume(m_volume.effective_level());
        });
    }

    void transport::impl::shutdown() {
        m_lifetime_token.reset();
        ++m_load_generation;
        m_events.clear();

        m_backend->set_ended_callback(nullptr);
        m_backend->set_time_update_callback(nullptr);
        m_backend->set_error_callback(nullptr);
        try {
            m_backend->stop();
        } catch (const std::exception& e) {
            LOG_ERROR("transport", "Failed to stop backend during shutdown:", e.what());
        } catch (...) {
            LOG_ERROR("transport", "Failed to stop backend during shutdown: unknown error");
        }
    }

    void transport::impl::set_state(playback_state state) {
        if (m_state == state) {
            return;
        }
        LOG_DEBUG("transport", "State", to_string(m_state), "->", to_string(state));
        m_state = state;
        m_events.publish(state_changed_event{state});
    }

    void transport::impl::emit_queue_changed() {
        m_events.publish(queue_changed_event{m_queue.size()});
    }

    void transport::impl::stop() {
        ++m_load_generation;
        guarded("Failed to stop playback", [this]() {
            m_backend->stop();
        });

        std::optional <std::string> previous_id;
        if (m_current) {
            previous_id = m_current->id;
        }
        m_current.reset();
        set_state(playback_state::stopped);
        m_events.publish(track_changed_event{std::nullopt, std::move(previous_id)});
    }

    void transport::impl::advance() {
        if (m_repeat == repeat_mode::one && m_current) {
            restart_current();
            return;
        }
        if (m_current) {
            m_history.push(*m_current);
        }
        resolve_next();
    }

    void transport::impl::resolve_next() {
        if (m_repeat == repeat_mode::one && m_current) {
            restart_current();
            return;
        }

        auto track = m_queue.pop_next();
        if (!track && m_repeat == repeat_mode::all && m_queue.reload_source(m_shuffle, m_rng)) {
            LOG_INFO("transport", "End of queue reached, repeating context of", m_queue.size(), "tracks");
            track = m_queue.pop_next();
        }

        if (!track) {
            LOG_INFO("transport", "Queue exhausted, stopping");
            stop();
            return;
        }
        begin_load(std::move(*track));
    }

    void transport::impl::restart_current() {
        if (m_state == playback_state::loading) {
            // the pending load starts the track from the top anyway
            return;
        }
        try {
            m_backend->seek(0.0);
            m_backend->play();
        } catch (...) {
            fail_playback("Failed to restart " + m_current->id, std::current_exception());
            return;
        }
        set_state(playback_state::playing);
    }

    void transport::impl::begin_load(queue_track track) {
        std::optional <std::string> previous_id;
        if (m_current) {
            previous_id = m_current->id;
        }
        m_current = std::move(track);
        const auto generation = ++m_load_generation;

        set_state(playback_state::loading);
        m_events.publish(track_changed_event{m_current, std::move(previous_id)});
        emit_queue_changed();

        LOG_INFO("transport", "Loading", m_current->id, "from", m_current->path);
        std::weak_ptr <void> alive = m_lifetime_token;
        try {
            m_backend->load_track(m_current->path, [this, alive, generation](std::exception_ptr err) {
                if (alive.expired()) {
                    return;
                }
                on_load_complete(generation, err);
            });
        } catch (...) {
            if (generation == m_load_generation) {
                fail_playback("Failed to load " + m_current->id, std::current_exception());
            }
        }
    }

    void transport::impl::on_load_complete(uint64_t generation, const std::exception_ptr& err) {
        if (generation != m_load_generation || m_state != playback_state::loading || !m_current) {
            LOG_DEBUG("transport", "Discarding completion of superseded load", generation);
            return;
        }

        if (err) {
            fail_playback("Failed to load " + m_current->id, err);
            return;
        }

        try {
            m_backend->set_volume(m_volume.effective_level());
            m_backend->play();
        } catch (...) {
            fail_playback("Failed to start " + m_current->id, std::current_exception());
            return;
        }
        LOG_INFO("transport", "Playing", m_current->id);
        set_state(playback_state::playing);
    }

    void transport::impl::on_ended() {
        if (m_state != playback_state::playing || !m_current) {
            // late notification for a track that is no longer current
            return;
        }
        const auto generation = m_load_generation;
        m_events.publish(track_finished_event{m_current->id});
        if (generation != m_load_generation || m_state != playback_state::playing) {
            // a listener already moved the transport elsewhere
            return;
        }
        advance();
    }

    void transport::impl::on_time_update(double position) {
        if (!m_current) {
            return;
        }
        m_events.publish(position_update_event{position, m_backend->get_duration()});
    }

    void transport::impl::fail_playback(const std::string& context, const std::exception_ptr& err) {
        const auto message = context + ": " + describe(err);
        LOG_ERROR("transport", message);

        ++m_load_generation;
        std::optional <std::string> previous_id;
        if (m_current) {
            previous_id = m_current->id;
        }
        m_current.reset();
        set_state(playback_state::stopped);
        m_events.publish(track_changed_event{std::nullopt, std::move(previous_id)});
        m_events.publish(error_event{message, err});
    }

    void transport::impl::report(const std::string& context, const std::exception_ptr& err) {
        const auto message = context + ": " + describe(err);
        LOG_WARN("transport", message);
        m_events.publish(error_event{message, err});
    }

    // ==============================================================================================================

    transport::transport(std::unique_ptr <audio_backend> backend, const playback_config& config) {
        if (!backend) {
            THROW_RUNTIME("transport requires an audio backend");
        }
        m_pimpl = std::make_unique <impl>(std::move(backend), config);
        m_pimpl->attach_backend();
        LOG_INFO("transport", "Created on backend", m_pimpl->m_backend->get_name(),
                 "shuffle:", to_string(config.shuffle), "repeat:", to_string(config.repeat),
                 "history:", config.history_size);
    }

    transport::~transport() {
        if (m_pimpl) {
            m_pimpl->shutdown();
        }
    }

    void transport::play() {
        switch (m_pimpl->m_state) {
            case playback_state::playing:
                return;
            case playback_state::paused:
                try {
                    m_pimpl->m_backend->play();
                } catch (...) {
                    m_pimpl->fail_playback("Failed to resume", std::current_exception());
                    return;
                }
                m_pimpl->set_state(playback_state::playing);
                return;
            case playback_state::stopped:
            case playback_state::loading:
                m_pimpl->resolve_next();
                return;
        }
    }

    void transport::pause() {
        if (m_pimpl->m_state != playback_state::playing) {
            return;
        }
        if (m_pimpl->guarded("Failed to pause", [this]() { m_pimpl->m_backend->pause(); })) {
            m_pimpl->set_state(playback_state::paused);
        }
    }

    void transport::stop() {
        m_pimpl->stop();
    }

    void transport::next() {
        m_pimpl->advance();
    }

    void transport::previous() {
        auto& d = *m_pimpl;
        if (d.m_backend->get_position() > restart_threshold_seconds) {
            seek(0.0);
            return;
        }

        auto previous_track = d.m_history.pop();
        if (!previous_track) {
            seek(0.0);
            return;
        }

        if (d.m_current) {
            d.m_queue.add_next(*d.m_current);
        }
        d.begin_load(std::move(*previous_track));
    }

    bool transport::skip_to_queue_index(std::size_t index) {
        auto& d = *m_pimpl;
        if (index >= d.m_queue.size()) {
            return false;
        }

        if (d.m_current) {
            d.m_history.push(*d.m_current);
        }
        if (auto skipped = d.m_queue.skip_to(index); skipped && !skipped->empty()) {
            LOG_DEBUG("transport", "Skipped", skipped->size(), "queued tracks");
        }

        auto track = d.m_queue.pop_next();
        if (!track) {
            THROW_RUNTIME("queue entry ", index, " vanished while skipping");
        }
        d.begin_load(std::move(*track));
        return true;
    }

    void transport::add_to_queue_next(queue_track track) {
        m_pimpl->m_queue.add_next(std::move(track));
        m_pimpl->emit_queue_changed();
    }

    void transport::add_to_queue_end(queue_track track) {
        m_pimpl->m_queue.add_to_end(std::move(track));
        m_pimpl->emit_queue_changed();
    }

    void transport::load_playlist(std::vector <queue_track> tracks) {
        LOG_DEBUG("transport", "New context with", tracks.size(), "tracks");
        m_pimpl->m_queue.load_source(std::move(tracks), m_pimpl->m_shuffle, m_pimpl->m_rng);
        // a new context starts a new listening session
        m_pimpl->m_history.clear();
        m_pimpl->emit_queue_changed();
    }

    void transport::append_to_queue(std::vector <queue_track> tracks) {
        m_pimpl->m_queue.append_source(std::move(tracks), m_pimpl->m_shuffle, m_pimpl->m_rng);
        m_pimpl->emit_queue_changed();
    }

    std::optional <queue_track> transport::remove_from_queue(std::size_t index) {
        auto removed = m_pimpl->m_queue.remove(index);
        if (removed) {
            m_pimpl->emit_queue_changed();
        }
        return removed;
    }

    bool transport::reorder_queue(std::size_t from, std::size_t to) {
        if (!m_pimpl->m_queue.reorder(from, to)) {
            return false;
        }
        if (from != to) {
            m_pimpl->emit_queue_changed();
        }
        return true;
    }

    void transport::clear_queue() {
        m_pimpl->m_queue.clear();
        m_pimpl->emit_queue_changed();
    }

    std::vector <queue_track> transport::get_queue() const {
        return m_pimpl->m_queue.get_all();
    }

    std::size_t transport::queue_length() const {
        return m_pimpl->m_queue.size();
    }

    std::optional <queue_track> transport::peek_next() const {
        if (m_pimpl->m_repeat == repeat_mode::one && m_pimpl->m_current) {
            return m_pimpl->m_current;
        }
        if (const auto* track = m_pimpl->m_queue.peek_next()) {
            return *track;
        }
        return std::nullopt;
    }

    void transport::set_shuffle(shuffle_mode mode) {
        auto& d = *m_pimpl;
        if (d.m_shuffle == mode) {
            return;
        }

        const auto old_mode = d.m_shuffle;
        d.m_shuffle = mode;
        if (mode == shuffle_mode::off) {
            d.m_queue.restore_original_order();
        } else {
            if (old_mode == shuffle_mode::off) {
                d.m_queue.snapshot_original_order();
            }
            d.m_queue.shuffle_source(mode, d.m_rng);
        }

        LOG_DEBUG("transport", "Shuffle", to_string(old_mode), "->", to_string(mode));
        d.m_events.publish(shuffle_changed_event{mode});
        d.emit_queue_changed();
    }

    shuffle_mode transport::get_shuffle() const {
        return m_pimpl->m_shuffle;
    }

    void transport::set_repeat(repeat_mode mode) {
        if (m_pimpl->m_repeat == mode) {
            return;
        }
        m_pimpl->m_repeat = mode;
        m_pimpl->m_events.publish(repeat_changed_event{mode});
    }

    repeat_mode transport::get_repeat() const {
        return m_pimpl->m_repeat;
    }

    void transport::set_volume(int level) {
        auto& d = *m_pimpl;
        const auto stored = d.m_volume.set_level(level);
        if (!d.m_volume.is_muted()) {
            d.guarded("Failed to set volume", [&d, stored]() { d.m_backend->set_volume(stored); });
        }
        d.m_events.publish(volume_changed_event{stored});
    }

    volume_level_t transport::get_volume() const {
        return m_pimpl->m_volume.level();
    }

    void transport::mute() {
        auto& d = *m_pimpl;
        if (!d.m_volume.mute()) {
            return;
        }
        d.guarded("Failed to mute", [&d]() { d.m_backend->set_volume(0); });
        d.m_events.publish(mute_changed_event{true});
    }

    void transport::unmute() {
        auto& d = *m_pimpl;
        if (!d.m_volume.unmute()) {
            return;
        }
        d.guarded("Failed to unmute", [&d]() { d.m_backend->set_volume(d.m_volume.level()); });
        d.m_events.publish(mute_changed_event{false});
    }

    void transport::toggle_mute() {
        if (m_pimpl->m_volume.is_muted()) {
            unmute();
        } else {
            mute();
        }
    }

    bool transport::is_muted() const {
        return m_pimpl->m_volume.is_muted();
    }

    float transport::get_gain_db() const {
        return m_pimpl->m_volume.gain_db();
    }

    void transport::seek(double position) {
        m_pimpl->guarded("Failed to seek", [this, position]() { m_pimpl->m_backend->seek(position); });
    }

    void transport::seek_percent(double percent) {
        const auto clamped = std::clamp(percent, 0.0, 100.0);
        seek(m_pimpl->m_backend->get_duration() * clamped / 100.0);
    }

    playback_state transport::get_state() const {
        return m_pimpl->m_state;
    }

    std::optional <queue_track> transport::get_current_track() const {
        return m_pimpl->m_current;
    }

    double transport::get_position() const {
        return m_pimpl->m_backend->get_position();
    }

    double transport::get_duration() const {
        return m_pimpl->m_backend->get_duration();
    }

    std::vector <queue_track> transport::get_history() const {
        return m_pimpl->m_history.get_all();
    }

    void transport::clear_history() {
        m_pimpl->m_history.clear();
    }

    void transport::set_history_size(std::size_t size) {
        m_pimpl->m_history.set_max_size(size);
    }

    bool transport::has_next() const {
        return !m_pimpl->m_queue.empty() || m_pimpl->m_repeat == repeat_mode::one;
    }

    bool transport::has_previous() const {
        return !m_pimpl->m_history.empty() || m_pimpl->m_repeat == repeat_mode::one;
    }

    event_bus::token_t transport::subscribe(event_type type, event_bus::handler_t handler) {
        return m_pimpl->m_events.subscribe(type, std::move(handler));
    }

    bool transport::unsubscribe(event_bus::token_t token) {
        return m_pimpl->m_events.unsubscribe(token);
    }

    event_bus& transport::events() {
        return m_pimpl->m_events;
    }
}

/*
 * Copyright (C) 2025
 *
 * This file is part of segue.
 *
 * segue is free software: you can redistribute it and/or modify it under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * segue is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with segue.  If not, see <http://www.gnu.org/licenses/>.
 */
