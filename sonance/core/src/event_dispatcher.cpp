#include <sonance/core/event_dispatcher.hpp>

namespace sonance::core {

void EventDispatcher::clear_all_handlers() {
    std::lock_guard<std::mutex> lock(m_handlers_mutex);
    m_handlers.clear();
}

void EventDispatcher::remove_handler(std::type_index type_idx, uint64_t handler_id) {
    std::lock_guard<std::mutex> lock(m_handlers_mutex);
    auto it = m_handlers.find(type_idx);
    if (it == m_handlers.end()) return;

    auto& handlers = it->second;
    handlers.erase(
        std::remove_if(handlers.begin(), handlers.end(),
            [handler_id](const Handler& h) { return h.id == handler_id; }),
        handlers.end()
    );
}

} // namespace sonance::core
