#pragma once

#include "../EngineEvent.hpp"

namespace geotrack::ports {

/// Broadcast channel toward the transport layer.
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    virtual void publish(const EngineEvent& event) = 0;
};

} // namespace geotrack::ports
