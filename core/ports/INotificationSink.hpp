#pragma once

#include "../Types.hpp"

namespace geotrack::ports {

class INotificationSink {
public:
    virtual ~INotificationSink() = default;

    virtual void notify(const GeofenceEvent& event, const Geofence& geofence) = 0;
};

} // namespace geotrack::ports
