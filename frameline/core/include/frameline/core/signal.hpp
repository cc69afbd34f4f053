#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace frameline::core {

// ============================================================================
// ScopedConnection - RAII handle for signal subscriptions
// ============================================================================

class ScopedConnection {
public:
    ScopedConnection() = default;

    explicit ScopedConnection(std::function<void()> disconnect_fn)
        : m_disconnect(std::move(disconnect_fn)) {}

    ~ScopedConnection() {
        disconnect();
    }

    // Non-copyable
    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    // Movable
    ScopedConnection(ScopedConnection&& other) noexcept
        : m_disconnect(std::move(other.m_disconnect)) {
        other.m_disconnect = nullptr;
    }

    ScopedConnection& operator=(ScopedConnection&& other) noexcept {
        if (this != &other) {
            disconnect();
            m_disconnect = std::move(other.m_disconnect);
            other.m_disconnect = nullptr;
        }
        return *this;
    }

    void disconnect() {
        if (m_disconnect) {
            m_disconnect();
            m_disconnect = nullptr;
        }
    }

    bool connected() const {
        return m_disconnect != nullptr;
    }

    // Release ownership without disconnecting
    void release() {
        m_disconnect = nullptr;
    }

private:
    std::function<void()> m_disconnect;
};

// ============================================================================
// Signal - Ordered observer list owned by the emitter
// ============================================================================
//
// Handlers run synchronously in subscription order. A connection may outlive
// the signal; disconnecting it afterwards is a no-op.

template<typename... Args>
class Signal {
public:
    using Handler = std::function<void(Args...)>;

    Signal() : m_state(std::make_shared<State>()) {}

    // Non-copyable, movable
    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;
    Signal(Signal&&) noexcept = default;
    Signal& operator=(Signal&&) noexcept = default;

    [[nodiscard]] ScopedConnection subscribe(Handler handler) {
        uint64_t id = m_state->next_id++;
        m_state->slots.push_back({id, std::move(handler)});

        std::weak_ptr<State> weak = m_state;
        return ScopedConnection([weak, id]() {
            if (auto state = weak.lock()) {
                auto& slots = state->slots;
                slots.erase(
                    std::remove_if(slots.begin(), slots.end(),
                        [id](const Slot& s) { return s.id == id; }),
                    slots.end()
                );
            }
        });
    }

    void emit(Args... args) const {
        // Copy so handlers may subscribe or disconnect while being notified
        auto slots = m_state->slots;
        for (const auto& slot : slots) {
            if (slot.handler) {
                slot.handler(args...);
            }
        }
    }

    size_t handler_count() const { return m_state->slots.size(); }

    void clear() { m_state->slots.clear(); }

private:
    struct Slot {
        uint64_t id;
        Handler handler;
    };

    struct State {
        std::vector<Slot> slots;
        uint64_t next_id = 1;
    };

    std::shared_ptr<State> m_state;
};

} // namespace frameline::core
