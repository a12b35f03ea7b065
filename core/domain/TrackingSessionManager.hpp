#pragma once

#include "../ports/ICache.hpp"
#include "../ports/ITrackingStore.hpp"
#include "../IClock.hpp"
#include "../KeyedMutex.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace geotrack::domain {

/// Counter increments produced by one committed ingestion step.
struct SessionDelta {
    uint64_t updates = 0;
    double distanceKm = 0.0;
};

/**
 * @brief Lifecycle state machine for per-trip tracking sessions
 *
 *   (none|completed) --start--> active
 *   active  --pause--> paused  --resume--> active
 *   active|paused --stop--> stopped --start--> active (counters kept)
 *   active|paused|stopped --complete--> completed
 *
 * At most one session per trip is active. Every mutation of a trip happens
 * under that trip's lock, is persisted through the store, and refreshes the
 * tracking_session:{tripId} cache snapshot on a best-effort basis.
 */
class TrackingSessionManager {
public:
    TrackingSessionManager(std::shared_ptr<ports::ITrackingStore> store,
                           std::shared_ptr<ports::ICache> cache,
                           std::shared_ptr<IClock> clock,
                           std::chrono::seconds snapshotTtl = std::chrono::seconds(3600));

    /**
     * @brief Start or restart tracking for a trip
     *
     * Restarting a stopped or paused trip reactivates the same session with
     * its counters, settings and original startedAt. totalDurationMin on the
     * next stop therefore spans the whole session, stopped time included.
     * A completed trip gets a fresh session.
     *
     * @throws TrackingError(SessionAlreadyActive) if the trip is already tracked
     */
    TrackingSession start(const std::string& tripId, const std::string& userId,
                          const TrackingSettings& settings,
                          const PrivacySettings& privacySettings);

    TrackingSession recordUpdate(const std::string& tripId, double distanceDeltaKm);
    TrackingSession recordBatch(const std::string& tripId, uint64_t updates, double distanceKm);

    /**
     * @brief Run @p apply and fold its delta into the counters atomically
     *
     * @p apply runs under the trip lock and only while the session is active,
     * so a concurrent stop either happens entirely before (apply never runs,
     * SessionNotActive) or entirely after. Exceptions from @p apply propagate
     * and leave the session untouched.
     */
    TrackingSession commitUpdate(const std::string& tripId,
                                 const std::function<SessionDelta(const TrackingSession&)>& apply);

    /// Already stopped or completed sessions are returned unchanged.
    TrackingSession stop(const std::string& tripId, const std::optional<std::string>& reason = std::nullopt);
    TrackingSession complete(const std::string& tripId);

    TrackingSession pause(const std::string& tripId);
    TrackingSession resume(const std::string& tripId);

    std::optional<TrackingSession> get(const std::string& tripId);
    TrackingSession requireActive(const std::string& tripId);

    /// Stop active sessions with no update for longer than @p threshold.
    std::size_t stopStaleSessions(std::chrono::hours threshold = std::chrono::hours(24));

    static TrackingSettings normalizeSettings(const TrackingSettings& settings);
    static std::string snapshotKey(const std::string& tripId);

private:
    TrackingSession load(const std::string& tripId);
    void persist(const TrackingSession& session);
    TrackingSession finish(const std::string& tripId, SessionStatus terminal,
                           const std::optional<std::string>& reason);

    std::shared_ptr<ports::ITrackingStore> store_;
    std::shared_ptr<ports::ICache> cache_;
    std::shared_ptr<IClock> clock_;
    std::chrono::seconds snapshotTtl_;

    KeyedMutex tripLocks_;
};

} // namespace geotrack::domain
