#pragma once

#include "../ports/INotificationSink.hpp"
#include <mutex>
#include <stdexcept>
#include <vector>

namespace geotrack::sim {

struct RecordedNotification {
    GeofenceEvent event;
    Geofence geofence;
};

class RecordingNotificationSink : public ports::INotificationSink {
public:
    void notify(const GeofenceEvent& event, const Geofence& geofence) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failNotify_) {
            throw std::runtime_error("notification channel down");
        }
        notifications_.push_back({event, geofence});
    }

    std::vector<RecordedNotification> notifications() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return notifications_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        notifications_.clear();
    }

    void setFailNotify(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        failNotify_ = fail;
    }

private:
    mutable std::mutex mutex_;
    std::vector<RecordedNotification> notifications_;
    bool failNotify_ = false;
};

} // namespace geotrack::sim
