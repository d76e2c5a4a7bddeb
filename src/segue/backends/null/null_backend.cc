#include <segue/backends/null/null_backend.hh>
#include <segue/error.hh>
#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

#include <failsafe/failsafe.hh>

namespace segue {
    null_backend::null_backend(callback_dispatcher& dispatcher, double default_duration)
        : m_dispatcher(dispatcher),
          m_token(dispatcher.register_producer()),
          m_default_duration(default_duration) {
    }

    null_backend::~null_backend() {
        // anything still queued refers to this object
        m_dispatcher.cleanup(m_token);
    }

    std::optional <double> null_backend::lookup_duration(const std::string& path) const {
        if (auto it = m_tracks.find(path); it != m_tracks.end()) {
            return it->second;
        }
        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec)) {
            return m_default_duration;
        }
        return std::nullopt;
    }

    void null_backend::load_track(const std::string& path, load_callback_t on_complete) {
        m_playing = false;
        m_position = 0.0;

        auto duration = lookup_duration(path);
        if (!duration) {
            LOG_WARN("null_backend", "No such track:", path);
            m_loaded.reset();
            m_duration = 0.0;
            auto err = std::make_exception_ptr(io_error("cannot open " + path));
            m_dispatcher.enqueue(m_token, [cbk = std::move(on_complete), err]() {
                if (cbk) {
                    cbk(err);
                }
            });
            return;
        }

        LOG_DEBUG("null_backend", "Loaded", path, "duration", *duration);
        m_loaded = path;
        m_duration = *duration;
        m_dispatcher.enqueue(m_token, [cbk = std::move(on_complete)]() {
            if (cbk) {
                cbk(nullptr);
            }
        });
    }

    void null_backend::play() {
        if (!m_loaded) {
            throw state_error("play() without a loaded track");
        }
        m_playing = true;
    }

    void null_backend::pause() {
        m_playing = false;
    }

    void null_backend::stop() {
        m_playing = false;
        m_loaded.reset();
        m_position = 0.0;
        m_duration = 0.0;
    }

    void null_backend::seek(double seconds) {
        m_position = std::clamp(seconds, 0.0, m_duration);
    }

    void null_backend::set_volume(volume_level_t level) {
        m_volume = level;
    }

    void null_backend::set_ended_callback(ended_callback_t callback) {
        m_on_ended = std::move(callback);
    }

    void null_backend::set_time_update_callback(time_update_callback_t callback) {
        m_on_time_update = std::move(callback);
    }

    void null_backend::set_error_callback(error_callback_t callback) {
        m_on_error = std::move(callback);
    }

    void null_backend::add_track(const std::string& path, double duration) {
        m_tracks[path] = duration;
    }

    void null_backend::advance(double seconds) {
        if (!m_playing || seconds <= 0.0) {
            return;
        }

        m_position = std::min(m_position + seconds, m_duration);
        const auto position = m_position;
        m_dispatcher.enqueue(m_token, [this, position]() {
            if (m_on_time_update) {
                m_on_time_update(position);
            }
        });

        if (m_position >= m_duration) {
            m_playing = false;
            m_dispatcher.enqueue(m_token, [this]() {
                if (m_on_ended) {
                    m_on_ended();
                }
            });
        }
    }

    void null_backend::raise_error(const std::string& message) {
        m_playing = false;
        auto err = std::make_exception_ptr(backend_error(message));
        m_dispatcher.enqueue(m_token, [this, err]() {
            if (m_on_error) {
                m_on_error(err);
            }
        });
    }

    std::unique_ptr <audio_backend> create_null_backend(callback_dispatcher& dispatcher) {
        return std::make_unique <null_backend>(dispatcher);
    }
}
