#include "QueueEventChannel.hpp"
#include <iostream>

namespace geotrack::adapters {

void QueueEventChannel::publish(const EngineEvent& event) {
    std::lock_guard<std::mutex> lock(queueMutex_);
    queue_.push(event);
}

void QueueEventChannel::subscribe(EngineEventType type, Handler handler) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    handlers_[type].push_back(std::move(handler));
}

void QueueEventChannel::unsubscribe(EngineEventType type) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    handlers_.erase(type);
}

std::size_t QueueEventChannel::processEvents() {
    std::size_t dispatched = 0;

    for (auto& event : drain()) {
        std::vector<Handler> targets;
        {
            std::lock_guard<std::mutex> lock(handlerMutex_);
            auto it = handlers_.find(event.type);
            if (it != handlers_.end()) {
                targets = it->second;
            }
        }

        for (const auto& handler : targets) {
            try {
                handler(event);
            } catch (const std::exception& e) {
                std::cerr << "[Channel] Handler for " << engineEventTypeToString(event.type)
                          << " failed: " << e.what() << std::endl;
            }
        }
        ++dispatched;
    }

    return dispatched;
}

std::vector<EngineEvent> QueueEventChannel::drain() {
    std::lock_guard<std::mutex> lock(queueMutex_);
    std::vector<EngineEvent> events;
    events.reserve(queue_.size());
    while (!queue_.empty()) {
        events.push_back(std::move(queue_.front()));
        queue_.pop();
    }
    return events;
}

std::size_t QueueEventChannel::size() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return queue_.size();
}

} // namespace geotrack::adapters
