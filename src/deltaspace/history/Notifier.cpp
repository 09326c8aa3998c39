#include "history/Notifier.hpp"

#include <vector>

namespace DS::History {

auto Notifier::create() -> std::shared_ptr<Notifier> {
    return std::shared_ptr<Notifier>(new Notifier());
}

auto Notifier::subscribe(Listener listener) -> Unsubscribe {
    auto const id = nextId++;
    listeners.emplace(id, std::move(listener));

    std::weak_ptr<Notifier> weak = weak_from_this();
    return [weak, id]() -> bool {
        if (auto self = weak.lock())
            return self->remove(id);
        return false;
    };
}

void Notifier::notifyAll() const {
    std::vector<Listener> snapshot;
    snapshot.reserve(listeners.size());
    for (auto const& [id, listener] : listeners)
        snapshot.push_back(listener);

    for (auto const& listener : snapshot) {
        if (listener)
            listener();
    }
}

auto Notifier::remove(std::uint64_t id) -> bool {
    return listeners.erase(id) > 0;
}

} // namespace DS::History
