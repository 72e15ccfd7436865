/**
 * @file Signal.hpp
 * @brief Multi-listener event with RAII subscription handles.
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace agentdeck::application {

/**
 * @class Subscription
 * @brief Move-only handle; disconnects its listener exactly once (reset() or destruction).
 */
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> disconnect) : m_disconnect(std::move(disconnect)) {}

    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept : m_disconnect(std::move(other.m_disconnect)) {
        other.m_disconnect = nullptr;
    }

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            m_disconnect = std::move(other.m_disconnect);
            other.m_disconnect = nullptr;
        }
        return *this;
    }

    void reset() {
        if (m_disconnect) {
            auto disconnect = std::move(m_disconnect);
            m_disconnect = nullptr;
            disconnect();
        }
    }

    bool active() const { return static_cast<bool>(m_disconnect); }

private:
    std::function<void()> m_disconnect;
};

/**
 * @class Signal
 * @brief Ordered list of listeners. Not thread-safe: connect and emit on the event loop.
 *
 * A listener disconnected while an emission is running is not called for the
 * remainder of that emission. Listeners connected during emission are called
 * from the next emission on.
 */
template <typename... Args>
class Signal {
public:
    using Handler = std::function<void(Args...)>;

    Signal() : m_state(std::make_shared<State>()) {}

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    Subscription connect(Handler handler) {
        auto slot = std::make_shared<Slot>();
        slot->id = m_state->nextId++;
        slot->handler = std::move(handler);
        m_state->slots.push_back(slot);

        std::weak_ptr<State> weakState = m_state;
        const std::uint64_t id = slot->id;
        return Subscription([weakState, id]() {
            auto state = weakState.lock();
            if (!state) {
                return;
            }
            auto& slots = state->slots;
            auto it = std::find_if(slots.begin(), slots.end(),
                                   [id](const std::shared_ptr<Slot>& s) { return s->id == id; });
            if (it != slots.end()) {
                (*it)->connected = false;
                slots.erase(it);
            }
        });
    }

    void emit(Args... args) const {
        const auto snapshot = m_state->slots;
        for (const auto& slot : snapshot) {
            if (slot->connected) {
                slot->handler(args...);
            }
        }
    }

    std::size_t listenerCount() const { return m_state->slots.size(); }

private:
    struct Slot {
        std::uint64_t id = 0;
        Handler handler;
        bool connected = true;
    };

    struct State {
        std::vector<std::shared_ptr<Slot>> slots;
        std::uint64_t nextId = 1;
    };

    std::shared_ptr<State> m_state;
};

} // namespace agentdeck::application
