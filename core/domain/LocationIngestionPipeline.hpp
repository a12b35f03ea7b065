#pragma once

#include "../ports/ITrackingStore.hpp"
#include "../IClock.hpp"
#include "../Errors.hpp"
#include "../KeyedMutex.hpp"
#include "TrackingSessionManager.hpp"
#include "PrivacyFilter.hpp"
#include "CurrentLocationCache.hpp"
#include "GeofenceEvaluator.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace geotrack::domain {

struct IngestResult {
    std::string sampleId;
    LocationSample filteredSample;
    double distanceDeltaKm = 0.0;
    std::optional<double> speedKmh;
    double totalDistanceKm = 0.0;
    bool latest = true;     ///< false for a fix older than one already stored
    std::vector<GeofenceEvent> events;
    std::optional<ErrorKind> geofenceError;
    TrackingSession session;
};

/// Outcome for one element of a batch, in input order.
struct BatchItemResult {
    std::size_t index = 0;
    bool success = false;
    std::optional<std::string> sampleId;
    std::optional<ErrorKind> error;
    std::string errorMessage;
    LocationSample input;
};

struct BatchResult {
    std::vector<BatchItemResult> items;
    std::size_t processed = 0;
    std::size_t successful = 0;
    std::size_t failed = 0;
    double distanceKm = 0.0;
    double totalDistanceKm = 0.0;
    std::optional<LocationSample> latestFiltered;
    bool latest = true;
    std::vector<GeofenceEvent> events;
    std::optional<ErrorKind> geofenceError;
    std::optional<TrackingSession> session;
};

/**
 * @brief Validates, measures, stores and evaluates incoming GPS samples
 *
 * Ingestion for one (trip, user) pair is serialized; different pairs run in
 * parallel. Storage writes happen inside the session manager's commit so a
 * sample racing a stop is either fully counted or rejected.
 *
 * Once a sample is committed the call succeeds. The current location and
 * geofence state only follow the newest fix; a late sample goes to history
 * alone. Geofence storage failures come back in geofenceError.
 */
class LocationIngestionPipeline {
public:
    LocationIngestionPipeline(std::shared_ptr<ports::ITrackingStore> store,
                              std::shared_ptr<TrackingSessionManager> sessions,
                              std::shared_ptr<PrivacyFilter> privacyFilter,
                              std::shared_ptr<CurrentLocationCache> locationCache,
                              std::shared_ptr<GeofenceEvaluator> evaluator,
                              std::shared_ptr<IClock> clock,
                              std::size_t maxBatchSize = 100,
                              double lowAccuracyWarningM = 100.0);

    /**
     * @throws TrackingError validation kinds, SessionNotActive, SessionNotFound,
     *         StorageUnavailable
     */
    IngestResult ingestOne(const std::string& tripId, const std::string& userId, const LocationSample& raw);

    /**
     * @brief Ingest several samples with one bulk write
     *
     * Invalid samples are reported per item and skipped.
     *
     * @throws TrackingError(BatchTooLarge), SessionNotActive, StorageUnavailable
     */
    BatchResult ingestBatch(const std::string& tripId, const std::string& userId,
                            const std::vector<LocationSample>& raw);

    /// Range checks; stamps a missing timestamp with @p now.
    LocationSample validate(const LocationSample& raw, Timestamp now) const;

private:
    std::mutex& pairLock(const std::string& tripId, const std::string& userId);

    std::shared_ptr<ports::ITrackingStore> store_;
    std::shared_ptr<TrackingSessionManager> sessions_;
    std::shared_ptr<PrivacyFilter> privacyFilter_;
    std::shared_ptr<CurrentLocationCache> locationCache_;
    std::shared_ptr<GeofenceEvaluator> evaluator_;
    std::shared_ptr<IClock> clock_;
    std::size_t maxBatchSize_;
    double lowAccuracyWarningM_;

    KeyedMutex ingestLocks_;
};

} // namespace geotrack::domain
