#include "ContainmentStateStore.hpp"

namespace geotrack::domain {

ContainmentStateStore::ContainmentStateStore(std::shared_ptr<ports::ITrackingStore> store)
    : store_(std::move(store)), locks_(256) {
}

ContainmentState ContainmentStateStore::update(const std::string& userId, const std::string& geofenceId,
                                               const Mutator& mutate) {
    std::lock_guard<std::mutex> lock(locks_.forKey(userId + '\x1f' + geofenceId));

    auto previous = store_->getContainmentState(userId, geofenceId);
    ContainmentState next = mutate(previous);
    next.userId = userId;
    next.geofenceId = geofenceId;

    store_->putContainmentState(next);
    return next;
}

std::optional<ContainmentState> ContainmentStateStore::get(const std::string& userId, const std::string& geofenceId) {
    return store_->getContainmentState(userId, geofenceId);
}

} // namespace geotrack::domain
