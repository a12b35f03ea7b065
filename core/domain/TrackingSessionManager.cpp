#include "TrackingSessionManager.hpp"
#include "../Errors.hpp"
#include "../JsonCodec.hpp"
#include "../../crypto/Uuid.hpp"
#include <algorithm>
#include <iostream>

namespace geotrack::domain {

namespace {

constexpr int kDefaultIntervalSec = 30;
constexpr int kBatteryOptimizedMinIntervalSec = 15;

} // namespace

TrackingSessionManager::TrackingSessionManager(std::shared_ptr<ports::ITrackingStore> store,
                                               std::shared_ptr<ports::ICache> cache,
                                               std::shared_ptr<IClock> clock,
                                               std::chrono::seconds snapshotTtl)
    : store_(std::move(store)), cache_(std::move(cache)), clock_(std::move(clock)),
      snapshotTtl_(snapshotTtl) {
}

TrackingSettings TrackingSessionManager::normalizeSettings(const TrackingSettings& settings) {
    TrackingSettings normalized = settings;
    if (normalized.intervalSec <= 0) {
        normalized.intervalSec = kDefaultIntervalSec;
    }
    if (normalized.batteryOptimization) {
        normalized.intervalSec = std::max(normalized.intervalSec, kBatteryOptimizedMinIntervalSec);
    }
    return normalized;
}

std::string TrackingSessionManager::snapshotKey(const std::string& tripId) {
    return "tracking_session:" + tripId;
}

TrackingSession TrackingSessionManager::load(const std::string& tripId) {
    auto session = store_->findSession(tripId);
    if (!session) {
        throw TrackingError(ErrorKind::SessionNotFound, "No tracking session for trip " + tripId);
    }
    return *session;
}

void TrackingSessionManager::persist(const TrackingSession& session) {
    store_->saveSession(session);

    try {
        cache_->set(snapshotKey(session.tripId), JsonCodec::sessionToJson(session).dump(), snapshotTtl_);
    } catch (const TrackingError& e) {
        std::cerr << "[Session] Snapshot skipped for trip " << session.tripId << ": " << e.what() << std::endl;
    }
}

TrackingSession TrackingSessionManager::start(const std::string& tripId, const std::string& userId,
                                              const TrackingSettings& settings,
                                              const PrivacySettings& privacySettings) {
    std::lock_guard<std::mutex> lock(tripLocks_.forKey(tripId));

    const auto now = clock_->now();
    auto existing = store_->findSession(tripId);

    if (existing && existing->status == SessionStatus::Active) {
        throw TrackingError(ErrorKind::SessionAlreadyActive, "Tracking is already active for trip " + tripId);
    }

    TrackingSession session;
    if (existing && existing->status != SessionStatus::Completed) {
        session = *existing;
        session.status = SessionStatus::Active;
        session.stoppedAt.reset();
        session.stopReason.reset();
        session.lastUpdateAt = now;
        std::cout << "[Session] Resumed " << session.id << " for trip " << tripId << std::endl;
    } else {
        session.id = Uuid::generateV4();
        session.tripId = tripId;
        session.userId = userId;
        session.status = SessionStatus::Active;
        session.startedAt = now;
        session.lastUpdateAt = now;
        session.settings = normalizeSettings(settings);
        session.privacySettings = privacySettings;
        std::cout << "[Session] Started " << session.id << " for trip " << tripId
                  << " (" << trackingLevelToString(privacySettings.trackingLevel) << ")" << std::endl;
    }

    persist(session);
    return session;
}

TrackingSession TrackingSessionManager::commitUpdate(const std::string& tripId,
                                                     const std::function<SessionDelta(const TrackingSession&)>& apply) {
    std::lock_guard<std::mutex> lock(tripLocks_.forKey(tripId));

    TrackingSession session = load(tripId);
    if (session.status != SessionStatus::Active) {
        throw TrackingError(ErrorKind::SessionNotActive,
                            "Tracking is " + sessionStatusToString(session.status) + " for trip " + tripId);
    }

    const SessionDelta delta = apply(session);

    session.totalUpdates += delta.updates;
    session.totalDistanceKm += delta.distanceKm;
    session.lastUpdateAt = clock_->now();

    persist(session);
    return session;
}

TrackingSession TrackingSessionManager::recordUpdate(const std::string& tripId, double distanceDeltaKm) {
    return commitUpdate(tripId, [distanceDeltaKm](const TrackingSession&) {
        return SessionDelta{1, distanceDeltaKm};
    });
}

TrackingSession TrackingSessionManager::recordBatch(const std::string& tripId, uint64_t updates, double distanceKm) {
    return commitUpdate(tripId, [updates, distanceKm](const TrackingSession&) {
        return SessionDelta{updates, distanceKm};
    });
}

TrackingSession TrackingSessionManager::finish(const std::string& tripId, SessionStatus terminal,
                                               const std::optional<std::string>& reason) {
    std::lock_guard<std::mutex> lock(tripLocks_.forKey(tripId));

    TrackingSession session = load(tripId);

    if (session.status == SessionStatus::Completed ||
        (session.status == SessionStatus::Stopped && terminal == SessionStatus::Stopped)) {
        return session;
    }

    const auto now = clock_->now();
    if (!session.stoppedAt) {
        session.stoppedAt = now;
        session.totalDurationMin = std::chrono::duration_cast<std::chrono::minutes>(
            now - session.startedAt).count();
    }
    session.status = terminal;
    if (reason) {
        session.stopReason = reason;
    }

    persist(session);

    std::cout << "[Session] " << sessionStatusToString(terminal) << " " << session.id
              << " for trip " << tripId << ": " << session.totalUpdates << " updates, "
              << session.totalDistanceKm << " km" << std::endl;
    return session;
}

TrackingSession TrackingSessionManager::stop(const std::string& tripId, const std::optional<std::string>& reason) {
    return finish(tripId, SessionStatus::Stopped, reason);
}

TrackingSession TrackingSessionManager::complete(const std::string& tripId) {
    return finish(tripId, SessionStatus::Completed, std::string("completed"));
}

TrackingSession TrackingSessionManager::pause(const std::string& tripId) {
    std::lock_guard<std::mutex> lock(tripLocks_.forKey(tripId));

    TrackingSession session = load(tripId);
    if (session.status != SessionStatus::Active) {
        throw TrackingError(ErrorKind::SessionNotActive, "Cannot pause trip " + tripId + " while " +
                            sessionStatusToString(session.status));
    }

    session.status = SessionStatus::Paused;
    persist(session);
    return session;
}

TrackingSession TrackingSessionManager::resume(const std::string& tripId) {
    std::lock_guard<std::mutex> lock(tripLocks_.forKey(tripId));

    TrackingSession session = load(tripId);
    if (session.status != SessionStatus::Paused) {
        throw TrackingError(ErrorKind::SessionNotActive, "Cannot resume trip " + tripId + " while " +
                            sessionStatusToString(session.status));
    }

    session.status = SessionStatus::Active;
    session.lastUpdateAt = clock_->now();
    persist(session);
    return session;
}

std::optional<TrackingSession> TrackingSessionManager::get(const std::string& tripId) {
    return store_->findSession(tripId);
}

TrackingSession TrackingSessionManager::requireActive(const std::string& tripId) {
    auto session = store_->findSession(tripId);
    if (!session || session->status != SessionStatus::Active) {
        throw TrackingError(ErrorKind::SessionNotActive, "Location tracking is not active for trip " + tripId);
    }
    return *session;
}

std::size_t TrackingSessionManager::stopStaleSessions(std::chrono::hours threshold) {
    const auto cutoff = clock_->now() - threshold;
    std::size_t stopped = 0;

    for (const auto& session : store_->listSessions()) {
        if (session.status != SessionStatus::Active || session.lastUpdateAt >= cutoff) {
            continue;
        }

        // Re-checked under the trip lock; an update may have landed since listing.
        std::lock_guard<std::mutex> lock(tripLocks_.forKey(session.tripId));
        TrackingSession current = load(session.tripId);
        if (current.status != SessionStatus::Active || current.lastUpdateAt >= cutoff) {
            continue;
        }

        const auto now = clock_->now();
        current.status = SessionStatus::Stopped;
        current.stoppedAt = now;
        current.stopReason = "stale";
        current.totalDurationMin = std::chrono::duration_cast<std::chrono::minutes>(
            now - current.startedAt).count();
        persist(current);
        ++stopped;
    }

    if (stopped > 0) {
        std::cout << "[Session] Stopped " << stopped << " stale session(s)" << std::endl;
    }
    return stopped;
}

} // namespace geotrack::domain
