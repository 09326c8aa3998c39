#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>

namespace DS::History {

/**
 * Opaque set of change callbacks.
 *
 * Listeners take no arguments; they re-read the owner's state when called.
 * The returned Unsubscribe holds only a weak reference to the Notifier, so it
 * stays safe to call after the owner is gone (it then reports false).
 */
class Notifier : public std::enable_shared_from_this<Notifier> {
public:
    using Listener    = std::function<void()>;
    using Unsubscribe = std::function<bool()>;

    [[nodiscard]] static auto create() -> std::shared_ptr<Notifier>;

    [[nodiscard]] auto subscribe(Listener listener) -> Unsubscribe;

    // Listeners added or removed from inside a callback take effect on the
    // next notification.
    void notifyAll() const;

    [[nodiscard]] auto listenerCount() const noexcept -> std::size_t { return listeners.size(); }

private:
    Notifier() = default;

    auto remove(std::uint64_t id) -> bool;

    std::map<std::uint64_t, Listener> listeners;
    std::uint64_t                     nextId = 1;
};

} // namespace DS::History
