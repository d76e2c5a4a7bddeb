#ifndef SEGUE_MOCK_BACKENDS_HH
#define SEGUE_MOCK_BACKENDS_HH

#include <segue/audio_backend.hh>
#include <segue/error.hh>
#include <algorithm>
#include <exception>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace segue::test {

    // Everything the mock records or is told to do. Shared with the test so
    // it stays readable after the transport (and the backend) is gone.
    struct mock_backend_state {
        // Recorded control calls: "load:<path>", "play", "pause", "stop",
        // "seek:<seconds>", "volume:<level>"
        std::vector<std::string> calls;

        // Loads not yet completed (only used when auto_complete is off)
        std::vector<std::pair<std::string, audio_backend::load_callback_t>> pending_loads;

        // Complete loads synchronously from inside load_track()
        bool auto_complete{true};
        // Paths whose load completes with an io_error
        std::set<std::string> failing_paths;

        // Synchronous failures
        bool throw_on_load{false};
        bool throw_on_play{false};
        bool throw_on_pause{false};
        bool throw_on_seek{false};
        bool throw_on_volume{false};
        // Failing calls throw an int instead of a segue error; play and
        // seek fail on this flag alone
        bool throw_non_standard{false};

        double position{0.0};
        double duration{200.0};
        volume_level_t volume{100};
        bool playing{false};

        audio_backend::ended_callback_t on_ended;
        audio_backend::time_update_callback_t on_time_update;
        audio_backend::error_callback_t on_error;

        std::size_t count(const std::string& call) const {
            return static_cast<std::size_t>(std::count(calls.begin(), calls.end(), call));
        }

        std::size_t count_prefix(const std::string& prefix) const {
            return static_cast<std::size_t>(std::count_if(calls.begin(), calls.end(),
                [&prefix](const std::string& c) { return c.compare(0, prefix.size(), prefix) == 0; }));
        }

        std::vector<std::string> loads() const {
            std::vector<std::string> result;
            for (const auto& c : calls) {
                if (c.compare(0, 5, "load:") == 0) {
                    result.push_back(c.substr(5));
                }
            }
            return result;
        }

        // Complete the pending load at index with success or err
        void complete_load(std::size_t index, std::exception_ptr err = nullptr) {
            auto cbk = std::move(pending_loads.at(index).second);
            pending_loads.erase(pending_loads.begin() + static_cast<std::ptrdiff_t>(index));
            if (cbk) {
                cbk(err);
            }
        }

        void complete_all() {
            while (!pending_loads.empty()) {
                complete_load(0);
            }
        }

        void fire_ended() {
            playing = false;
            if (on_ended) {
                on_ended();
            }
        }

        void fire_time_update(double seconds) {
            position = seconds;
            if (on_time_update) {
                on_time_update(seconds);
            }
        }

        void fire_error(const std::string& message) {
            playing = false;
            if (on_error) {
                on_error(std::make_exception_ptr(backend_error(message)));
            }
        }
    };

    // Scriptable backend; all behavior lives in the shared state
    class mock_backend : public audio_backend {
        private:
            template <typename Error>
            [[noreturn]] void fail(const char* message) const {
                if (m_state->throw_non_standard) {
                    throw 42;
                }
                throw Error(message);
            }

        public:
            explicit mock_backend(std::shared_ptr<mock_backend_state> state)
                : m_state(std::move(state)) {}

            std::string get_name() const override { return "Mock"; }

            void load_track(const std::string& path, load_callback_t on_complete) override {
                m_state->calls.push_back("load:" + path);
                if (m_state->throw_on_load) {
                    fail<backend_error>("Mock backend load failed");
                }
                m_state->position = 0.0;
                m_state->playing = false;

                if (!m_state->auto_complete) {
                    m_state->pending_loads.emplace_back(path, std::move(on_complete));
                    return;
                }
                if (m_state->failing_paths.count(path) > 0) {
                    on_complete(std::make_exception_ptr(io_error("Mock backend cannot open " + path)));
                } else {
                    on_complete(nullptr);
                }
            }

            void play() override {
                m_state->calls.emplace_back("play");
                if (m_state->throw_on_play || m_state->throw_non_standard) {
                    fail<state_error>("Mock backend play failed");
                }
                m_state->playing = true;
            }

            void pause() override {
                m_state->calls.emplace_back("pause");
                if (m_state->throw_on_pause) {
                    fail<backend_error>("Mock backend pause failed");
                }
                m_state->playing = false;
            }

            void stop() override {
                m_state->calls.emplace_back("stop");
                m_state->playing = false;
                m_state->position = 0.0;
            }

            void seek(double seconds) override {
                m_state->calls.push_back("seek:" + std::to_string(static_cast<int>(seconds)));
                if (m_state->throw_on_seek || m_state->throw_non_standard) {
                    fail<backend_error>("Mock backend seek failed");
                }
                m_state->position = std::clamp(seconds, 0.0, m_state->duration);
            }

            void set_volume(volume_level_t level) override {
                m_state->calls.push_back("volume:" + std::to_string(level));
                if (m_state->throw_on_volume) {
                    fail<backend_error>("Mock backend volume failed");
                }
                m_state->volume = level;
            }

            double get_position() const override { return m_state->position; }
            double get_duration() const override { return m_state->duration; }

            void set_ended_callback(ended_callback_t callback) override {
                m_state->on_ended = std::move(callback);
            }

            void set_time_update_callback(time_update_callback_t callback) override {
                m_state->on_time_update = std::move(callback);
            }

            void set_error_callback(error_callback_t callback) override {
                m_state->on_error = std::move(callback);
            }

        private:
            std::shared_ptr<mock_backend_state> m_state;
    };

    inline std::unique_ptr<audio_backend> create_mock_backend(std::shared_ptr<mock_backend_state> state) {
        return std::make_unique<mock_backend>(std::move(state));
    }

} // namespace segue::test

#endif // SEGUE_MOCK_BACKENDS_HH
