#pragma once

#include "../ports/ITrackingStore.hpp"
#include "../KeyedMutex.hpp"
#include <functional>
#include <memory>
#include <optional>

namespace geotrack::domain {

/**
 * @brief Serialized read-modify-write of ContainmentState per (user, geofence)
 *
 * The mutator sees the previous state (absent for a first observation) and
 * returns the state to store. Concurrent updates of the same pair never
 * observe the same previous state.
 */
class ContainmentStateStore {
public:
    using Mutator = std::function<ContainmentState(const std::optional<ContainmentState>&)>;

    explicit ContainmentStateStore(std::shared_ptr<ports::ITrackingStore> store);

    ContainmentState update(const std::string& userId, const std::string& geofenceId, const Mutator& mutate);

    std::optional<ContainmentState> get(const std::string& userId, const std::string& geofenceId);

private:
    std::shared_ptr<ports::ITrackingStore> store_;
    KeyedMutex locks_;
};

} // namespace geotrack::domain
