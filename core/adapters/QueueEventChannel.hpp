#pragma once

#include "../ports/IEventPublisher.hpp"
#include <functional>
#include <mutex>
#include <queue>
#include <unordered_map>
#include <vector>

namespace geotrack::adapters {

/**
 * @brief Broadcast channel that buffers engine events for the caller
 *
 * publish() only enqueues. The owner either drains the queue or registers
 * handlers and pumps processEvents() from its own loop.
 */
class QueueEventChannel : public ports::IEventPublisher {
public:
    using Handler = std::function<void(const EngineEvent&)>;

    QueueEventChannel() = default;
    ~QueueEventChannel() override = default;

    void publish(const EngineEvent& event) override;

    void subscribe(EngineEventType type, Handler handler);
    void unsubscribe(EngineEventType type);

    /// Dispatch queued events to subscribers; returns how many were dispatched.
    std::size_t processEvents();

    std::vector<EngineEvent> drain();
    std::size_t size() const;

private:
    std::unordered_map<EngineEventType, std::vector<Handler>> handlers_;
    std::queue<EngineEvent> queue_;
    mutable std::mutex queueMutex_;
    std::mutex handlerMutex_;
};

} // namespace geotrack::adapters
