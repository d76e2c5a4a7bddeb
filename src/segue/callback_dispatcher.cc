#include <segue/callback_dispatcher.hh>
#include <exception>
#include <vector>
#include <iterator>

#include <failsafe/failsafe.hh>

namespace segue {
    callback_dispatcher::token_t callback_dispatcher::register_producer() {
        std::lock_guard <std::mutex> lk(m_mutex);
        return m_next_token++;
    }

    void callback_dispatcher::enqueue(token_t token, std::function <void()> cbk) {
        std::lock_guard <std::mutex> lk(m_mutex);
        m_queue.emplace_back(token, std::move(cbk));
    }

    std::size_t callback_dispatcher::dispatch() {
        // 1) snapshot & clear under lock
        std::vector <callback_t> to_dispatch; {
            std::lock_guard <std::mutex> lk(m_mutex);
            to_dispatch.assign(std::make_move_iterator(m_queue.begin()), std::make_move_iterator(m_queue.end()));
            m_queue.clear();
        }

        // 2) invoke each on the calling thread
        for (auto& [token, cbk] : to_dispatch) {
            try {
                cbk();
            } catch (const std::exception& e) {
                LOG_ERROR("callback_dispatcher", "Callback of producer", token, "threw:", e.what());
            } catch (...) {
                LOG_ERROR("callback_dispatcher", "Callback of producer", token, "threw a non-standard exception");
            }
        }
        return to_dispatch.size();
    }

    void callback_dispatcher::cleanup(token_t token) {
        std::lock_guard <std::mutex> lk(m_mutex);
        auto it = m_queue.begin();
        while (it != m_queue.end()) {
            if (it->first == token) {
                it = m_queue.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::size_t callback_dispatcher::pending() const {
        std::lock_guard <std::mutex> lk(m_mutex);
        return m_queue.size();
    }
}
