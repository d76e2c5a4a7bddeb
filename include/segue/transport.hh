/**
 * @file transport.hh
 * @brief Playback queue and transport state machine
 * @ingroup transport
 */

// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <vector>
#include <segue/types.hh>
#include <segue/events.hh>
#include <segue/event_bus.hh>
#include <segue/audio_backend.hh>
#include <segue/export_segue.h>

namespace segue {

    /**
     * @class transport
     * @brief Single authority for what plays now, next and before
     * @ingroup transport
     *
     * The transport owns the two-tier queue, the play history, shuffle and
     * repeat modes and the volume state. Audio I/O is delegated to the
     * audio_backend passed to the constructor, which the transport owns
     * exclusively.
     *
     * ## Basic Usage
     *
     * @code
     * segue::callback_dispatcher dispatcher;
     * segue::transport player(segue::create_null_backend(dispatcher), {});
     *
     * player.subscribe<segue::track_changed_event>([](const auto& e) {
     *     if (e.track) {
     *         std::cout << "Now playing: " << e.track->title << "\n";
     *     }
     * });
     *
     * player.load_playlist(album_tracks);
     * player.play();
     *
     * // event loop
     * while (running) {
     *     dispatcher.dispatch();
     * }
     * @endcode
     *
     * ## State Machine
     *
     * - **stopped**: nothing loaded
     * - **loading**: a track was taken from the queue and the backend is
     *   loading it
     * - **playing**: the backend is producing sound
     * - **paused**: playback suspended mid-track
     *
     * ## Choosing the next track
     *
     * 1. Repeat one with a current track: restart it, leave the queue alone.
     * 2. Head of the explicit queue.
     * 3. Head of the source queue.
     * 4. Repeat all: refill the source queue from the context (reshuffled if
     *    shuffle is on) and take its head.
     * 5. Nothing left: stop().
     *
     * ## Errors
     *
     * Backend failures never escape these methods. They are logged, force
     * the stopped state where playback cannot continue, and are published
     * as error_event. A track that failed to load is not retried and the
     * queue is not advanced past it.
     *
     * ## Thread Safety
     *
     * - **Not thread-safe**: call every method from the owning thread
     * - **Callbacks**: backend notifications must arrive on the owning thread
     *   (see callback_dispatcher)
     */
    class SEGUE_EXPORT transport {
        public:
            /**
             * @brief Create a transport around a backend
             * @param backend Backend to drive; must not be null
             * @param config Session defaults
             * @throws std::runtime_error if @p backend is null
             */
            transport(std::unique_ptr <audio_backend> backend, const playback_config& config);

            /**
             * @brief Stops the backend, detaches its callbacks and drops all listeners
             */
            ~transport();

            transport(const transport&) = delete;
            transport& operator=(const transport&) = delete;

            // ========================================================================
            // Playback control
            // ========================================================================

            /**
             * @brief Resume when paused, otherwise start the next queued track
             *
             * No-op while already playing.
             */
            void play();

            /**
             * @brief Pause; only has an effect while playing
             */
            void pause();

            /**
             * @brief Stop output and forget the current track
             *
             * Always publishes a track_changed_event with an empty track. A
             * load still in flight is discarded when it completes.
             */
            void stop();

            /**
             * @brief Move on to the next track
             *
             * The current track goes to the history, except under repeat one,
             * where the current track simply restarts.
             */
            void next();

            /**
             * @brief Go back
             *
             * More than 3 seconds into the track this restarts it. Otherwise
             * the most recent history entry is loaded and the current track
             * is put in front of the explicit queue. With an empty history the
             * current track restarts.
             */
            void previous();

            /**
             * @brief Jump to a queue entry
             *
             * The current track goes to the history; entries in front of
             * @p index are dropped without being recorded as played.
             *
             * @return false if @p index is out of range
             */
            bool skip_to_queue_index(std::size_t index);

            // ========================================================================
            // Queue
            // ========================================================================

            /**
             * @brief Play @p track right after the current one
             */
            void add_to_queue_next(queue_track track);

            /**
             * @brief Append @p track to the explicit queue
             */
            void add_to_queue_end(queue_track track);

            /**
             * @brief Replace the context (album, playlist) and empty the explicit queue
             *
             * The play history is cleared as well.
             */
            void load_playlist(std::vector <queue_track> tracks);

            /**
             * @brief Add more tracks from the current context
             */
            void append_to_queue(std::vector <queue_track> tracks);

            /**
             * @brief Remove the entry at @p index of get_queue()
             * @return The removed track, or nothing if out of range
             */
            std::optional <queue_track> remove_from_queue(std::size_t index);

            /**
             * @brief Move an entry within its tier
             * @return false for out-of-range indices or moves across tiers
             */
            bool reorder_queue(std::size_t from, std::size_t to);

            void clear_queue();

            /**
             * @brief Upcoming tracks: explicit queue, then source queue
             */
            [[nodiscard]] std::vector <queue_track> get_queue() const;

            [[nodiscard]] std::size_t queue_length() const;

            /**
             * @brief The track next() would start, without changing anything
             *
             * Under repeat one this is the current track. The repeat-all wrap
             * is not predicted.
             */
            [[nodiscard]] std::optional <queue_track> peek_next() const;

            // ========================================================================
            // Shuffle and repeat
            // ========================================================================

            void set_shuffle(shuffle_mode mode);
            [[nodiscard]] shuffle_mode get_shuffle() const;

            void set_repeat(repeat_mode mode);
            [[nodiscard]] repeat_mode get_repeat() const;

            // ========================================================================
            // Volume
            // ========================================================================

            /**
             * @brief Set volume, clamped to [0, 100]
             *
             * While muted the new level is remembered but not sent to the
             * backend.
             */
            void set_volume(int level);
            [[nodiscard]] volume_level_t get_volume() const;

            void mute();
            void unmute();
            void toggle_mute();
            [[nodiscard]] bool is_muted() const;

            /**
             * @brief Perceptual gain of the current volume (-60 dB .. 0 dB)
             */
            [[nodiscard]] float get_gain_db() const;

            // ========================================================================
            // Seeking
            // ========================================================================

            /**
             * @brief Seek to @p position seconds; the backend clamps
             */
            void seek(double position);

            /**
             * @brief Seek to @p percent (0..100) of the track duration
             */
            void seek_percent(double percent);

            // ========================================================================
            // State
            // ========================================================================

            [[nodiscard]] playback_state get_state() const;
            [[nodiscard]] std::optional <queue_track> get_current_track() const;

            /**
             * @brief Play head in seconds as reported by the backend
             */
            [[nodiscard]] double get_position() const;

            /**
             * @brief Track length in seconds as reported by the backend
             */
            [[nodiscard]] double get_duration() const;

            /**
             * @brief Played tracks, oldest first
             */
            [[nodiscard]] std::vector <queue_track> get_history() const;
            void clear_history();

            /**
             * @brief Change the history capacity, evicting the oldest entries
             */
            void set_history_size(std::size_t size);

            [[nodiscard]] bool has_next() const;
            [[nodiscard]] bool has_previous() const;

            // ========================================================================
            // Events
            // ========================================================================

            event_bus::token_t subscribe(event_type type, event_bus::handler_t handler);

            template <typename Event>
            event_bus::token_t subscribe(std::function <void(const Event&)> handler) {
                return events().subscribe <Event>(std::move(handler));
            }

            bool unsubscribe(event_bus::token_t token);

        private:
            event_bus& events();

            struct impl;
            std::unique_ptr <impl> m_pimpl;
    };

} // namespace segue

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
