#include "SimulatedClock.hpp"

namespace geotrack::sim {

SimulatedClock::SimulatedClock(Timestamp startTime)
    : simulatedTime_(startTime) {
}

Timestamp SimulatedClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return simulatedTime_;
}

std::string SimulatedClock::getIsoTimestamp() const {
    return formatIso8601(now());
}

void SimulatedClock::advance(std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    simulatedTime_ += duration;
}

void SimulatedClock::setCurrentTime(Timestamp time) {
    std::lock_guard<std::mutex> lock(mutex_);
    simulatedTime_ = time;
}

} // namespace geotrack::sim
