#pragma once
// Signal.hpp - Minimal observer for plain C++ classes
// Qt signals need QObject + moc; this does not. Not thread-safe: connect and
// emit from the owning thread only.

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace cal {

template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using ConnectionId = std::size_t;

    ConnectionId connect(Slot slot) {
        slots_.push_back({nextId_, std::move(slot)});
        return nextId_++;
    }

    void disconnect(ConnectionId id) {
        std::erase_if(slots_, [id](const auto& s) { return s.id == id; });
    }

    void disconnectAll() {
        slots_.clear();
    }

    template <typename... EmitArgs>
    void emitSignal(EmitArgs&&... args) const {
        // Copy so a slot may disconnect itself while we iterate
        auto slots = slots_;
        for (const auto& s : slots) {
            s.fn(args...);
        }
    }

    bool empty() const {
        return slots_.empty();
    }

private:
    struct Entry {
        ConnectionId id;
        Slot fn;
    };

    std::vector<Entry> slots_;
    ConnectionId nextId_{0};
};

} // namespace cal
