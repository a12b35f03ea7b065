#pragma once

#include "../IClock.hpp"
#include <chrono>
#include <mutex>
#include <string>

namespace geotrack::sim {

/// Manually driven clock; time only moves through advance() and setCurrentTime().
class SimulatedClock : public IClock {
public:
    explicit SimulatedClock(Timestamp startTime = fromEpochSeconds(1700000000));
    ~SimulatedClock() override = default;

    Timestamp now() const override;
    std::string getIsoTimestamp() const;

    void advance(std::chrono::milliseconds duration);
    void setCurrentTime(Timestamp time);

private:
    mutable std::mutex mutex_;
    Timestamp simulatedTime_;
};

} // namespace geotrack::sim
