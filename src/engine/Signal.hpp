#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <vector>

namespace tickwell {

/// Handler ID for disconnecting
using SignalHandlerId = uint64_t;

/// Invalid handler ID sentinel
constexpr SignalHandlerId InvalidSignalHandlerId = 0;

/// Typed multicast notification list.
///
/// Handlers are invoked synchronously in connection order. Connecting or
/// disconnecting from inside a handler is allowed: emit() walks a copy of
/// the handler list and skips handlers disconnected mid-dispatch.
template <typename... Args>
class Signal {
public:
    using Handler = std::function<void(Args...)>;

    SignalHandlerId connect(Handler handler) {
        SignalHandlerId id = m_nextId++;
        m_handlers.push_back({id, std::move(handler)});
        return id;
    }

    bool disconnect(SignalHandlerId id) {
        auto it = std::find_if(m_handlers.begin(), m_handlers.end(),
            [id](const HandlerEntry& entry) { return entry.id == id; });
        if (it == m_handlers.end()) return false;
        m_handlers.erase(it);
        return true;
    }

    void emit(Args... args) const {
        if (m_handlers.empty()) return;

        // Copy handlers to allow safe modification during iteration
        auto handlers = m_handlers;
        for (const auto& handler : handlers) {
            if (!isConnected(handler.id)) continue;
            handler.callback(args...);
        }
    }

    bool isConnected(SignalHandlerId id) const {
        return std::any_of(m_handlers.begin(), m_handlers.end(),
            [id](const HandlerEntry& entry) { return entry.id == id; });
    }

    size_t handlerCount() const { return m_handlers.size(); }

    void clear() { m_handlers.clear(); }

private:
    struct HandlerEntry {
        SignalHandlerId id;
        Handler callback;
    };

    std::vector<HandlerEntry> m_handlers;
    SignalHandlerId m_nextId = 1;
};

} // namespace tickwell
