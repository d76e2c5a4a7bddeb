#include <segue/event_bus.hh>
#include <algorithm>
#include <exception>

#include <failsafe/failsafe.hh>

namespace segue {
    event_bus::token_t event_bus::subscribe(event_type type, handler_t handler) {
        const auto token = m_next_token++;
        m_subscribers[type].push_back({token, std::move(handler)});
        return token;
    }

    bool event_bus::unsubscribe(token_t token) {
        for (auto& [type, list] : m_subscribers) {
            auto it = std::find_if(list.begin(), list.end(),
                                   [token](const subscriber& s) { return s.token == token; });
            if (it != list.end()) {
                list.erase(it);
                return true;
            }
        }
        return false;
    }

    void event_bus::publish(const playback_event& event) {
        const auto type = type_of(event);
        auto it = m_subscribers.find(type);
        if (it == m_subscribers.end() || it->second.empty()) {
            return;
        }

        // Copy so handlers can (un)subscribe while we iterate
        const auto handlers = it->second;
        for (const auto& s : handlers) {
            try {
                s.handler(event);
            } catch (const std::exception& e) {
                LOG_ERROR("event_bus", "Listener for", to_string(type), "threw:", e.what());
            } catch (...) {
                LOG_ERROR("event_bus", "Listener for", to_string(type), "threw a non-standard exception");
            }
        }
    }

    void event_bus::clear() {
        m_subscribers.clear();
    }

    std::size_t event_bus::subscriber_count(event_type type) const {
        auto it = m_subscribers.find(type);
        return it == m_subscribers.end() ? 0 : it->second.size();
    }
}
