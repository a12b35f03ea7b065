#pragma once

#include "../ports/INotificationSink.hpp"
#include "../IClock.hpp"
#include <iostream>

namespace geotrack::adapters {

/// Writes each geofence notification as one console line.
class LoggingNotificationSink : public ports::INotificationSink {
public:
    void notify(const GeofenceEvent& event, const Geofence& geofence) override {
        std::cout << "[Notify] " << geofenceEventKindToString(event.kind)
                  << " " << geofence.name << " (" << geofence.id << ")"
                  << " user=" << event.userId
                  << " trip=" << event.tripId
                  << " at " << formatIso8601(event.triggeredAt);
        if (event.dwellSeconds) {
            std::cout << " dwell=" << *event.dwellSeconds << "s";
        }
        std::cout << std::endl;
    }
};

} // namespace geotrack::adapters
