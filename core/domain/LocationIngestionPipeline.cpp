#include "LocationIngestionPipeline.hpp"
#include "../Geo.hpp"
#include "../../crypto/Uuid.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace geotrack::domain {

namespace {

constexpr double kMaxAccuracyM = 10000.0;
constexpr double kMaxSpeedMps = 500.0;

struct Motion {
    double distanceKm = 0.0;
    std::optional<double> speedKmh;
};

// Distance and speed from the previous fix; fills a missing device speed.
Motion measure(const std::optional<LocationSample>& previous, LocationSample& sample) {
    Motion motion;
    if (!previous) {
        return motion;
    }

    motion.distanceKm = Geo::distanceKm(previous->coordinates, sample.coordinates);

    if (previous->timestamp && sample.timestamp) {
        const double seconds = std::chrono::duration<double>(*sample.timestamp - *previous->timestamp).count();
        if (seconds > 0.0) {
            motion.speedKmh = motion.distanceKm / (seconds / 3600.0);
            if (!sample.speedMps) {
                sample.speedMps = *motion.speedKmh / 3.6;
            }
        }
    }
    return motion;
}

bool isNewest(const std::optional<LocationSample>& stored, Timestamp at) {
    return !stored || !stored->timestamp || at >= *stored->timestamp;
}

} // namespace

LocationIngestionPipeline::LocationIngestionPipeline(std::shared_ptr<ports::ITrackingStore> store,
                                                     std::shared_ptr<TrackingSessionManager> sessions,
                                                     std::shared_ptr<PrivacyFilter> privacyFilter,
                                                     std::shared_ptr<CurrentLocationCache> locationCache,
                                                     std::shared_ptr<GeofenceEvaluator> evaluator,
                                                     std::shared_ptr<IClock> clock,
                                                     std::size_t maxBatchSize,
                                                     double lowAccuracyWarningM)
    : store_(std::move(store)), sessions_(std::move(sessions)), privacyFilter_(std::move(privacyFilter)),
      locationCache_(std::move(locationCache)), evaluator_(std::move(evaluator)), clock_(std::move(clock)),
      maxBatchSize_(maxBatchSize), lowAccuracyWarningM_(lowAccuracyWarningM) {
}

std::mutex& LocationIngestionPipeline::pairLock(const std::string& tripId, const std::string& userId) {
    return ingestLocks_.forKey(tripId + '\x1f' + userId);
}

LocationSample LocationIngestionPipeline::validate(const LocationSample& raw, Timestamp now) const {
    const auto& c = raw.coordinates;
    if (!std::isfinite(c.lat) || c.lat < -90.0 || c.lat > 90.0) {
        throw TrackingError(ErrorKind::InvalidCoordinates, "Latitude must be between -90 and 90");
    }
    if (!std::isfinite(c.lon) || c.lon < -180.0 || c.lon > 180.0) {
        throw TrackingError(ErrorKind::InvalidCoordinates, "Longitude must be between -180 and 180");
    }
    if (raw.accuracyM && (!std::isfinite(*raw.accuracyM) || *raw.accuracyM < 0.0 || *raw.accuracyM > kMaxAccuracyM)) {
        throw TrackingError(ErrorKind::InvalidAccuracy, "Accuracy must be between 0 and 10000 meters");
    }
    if (raw.speedMps && (!std::isfinite(*raw.speedMps) || *raw.speedMps < 0.0 || *raw.speedMps > kMaxSpeedMps)) {
        throw TrackingError(ErrorKind::InvalidSpeed, "Speed must be between 0 and 500 m/s");
    }

    if (raw.accuracyM && *raw.accuracyM > lowAccuracyWarningM_) {
        std::cout << "[Ingestion] Low accuracy location update: " << *raw.accuracyM << "m" << std::endl;
    }

    LocationSample sample = raw;
    if (!sample.timestamp) {
        sample.timestamp = now;
    }
    return sample;
}

IngestResult LocationIngestionPipeline::ingestOne(const std::string& tripId, const std::string& userId,
                                                  const LocationSample& raw) {
    std::lock_guard<std::mutex> lock(pairLock(tripId, userId));

    LocationSample sample = validate(raw, clock_->now());
    sample.id = Uuid::generateV4();
    sample.tripId = tripId;
    sample.userId = userId;

    IngestResult result;
    Motion motion;

    result.session = sessions_->commitUpdate(tripId, [&](const TrackingSession&) {
        auto previous = store_->lastSample(tripId, userId);
        result.latest = isNewest(previous, *sample.timestamp);
        motion = measure(previous, sample);
        store_->appendSample(sample);
        return SessionDelta{1, motion.distanceKm};
    });

    result.sampleId = sample.id;
    result.filteredSample = privacyFilter_->apply(sample, result.session.privacySettings.trackingLevel);
    result.distanceDeltaKm = motion.distanceKm;
    result.speedKmh = motion.speedKmh;
    result.totalDistanceKm = result.session.totalDistanceKm;

    if (!result.latest) {
        std::cout << "[Ingestion] Late sample for trip " << tripId << " at "
                  << formatIso8601(*sample.timestamp) << " stored in history only" << std::endl;
        return result;
    }

    locationCache_->put(result.filteredSample);

    auto evaluation = evaluator_->evaluate(tripId, userId, sample.coordinates, *sample.timestamp);
    result.events = std::move(evaluation.events);
    result.geofenceError = evaluation.error;
    return result;
}

BatchResult LocationIngestionPipeline::ingestBatch(const std::string& tripId, const std::string& userId,
                                                   const std::vector<LocationSample>& raw) {
    if (raw.size() > maxBatchSize_) {
        throw TrackingError(ErrorKind::BatchTooLarge,
                            "Batch of " + std::to_string(raw.size()) + " exceeds limit of " +
                            std::to_string(maxBatchSize_));
    }

    std::lock_guard<std::mutex> lock(pairLock(tripId, userId));
    sessions_->requireActive(tripId);

    BatchResult result;
    result.processed = raw.size();
    result.items.resize(raw.size());

    const auto now = clock_->now();
    std::vector<std::pair<std::size_t, LocationSample>> accepted;

    for (std::size_t i = 0; i < raw.size(); ++i) {
        auto& item = result.items[i];
        item.index = i;
        item.input = raw[i];
        try {
            LocationSample sample = validate(raw[i], now);
            sample.id = Uuid::generateV4();
            sample.tripId = tripId;
            sample.userId = userId;
            accepted.emplace_back(i, std::move(sample));
        } catch (const TrackingError& e) {
            item.error = e.kind();
            item.errorMessage = e.what();
        }
    }

    result.failed = raw.size() - accepted.size();
    if (accepted.empty()) {
        std::cout << "[Ingestion] Batch for trip " << tripId << " had no valid samples" << std::endl;
        return result;
    }

    std::stable_sort(accepted.begin(), accepted.end(), [](const auto& a, const auto& b) {
        return *a.second.timestamp < *b.second.timestamp;
    });

    auto session = sessions_->commitUpdate(tripId, [&](const TrackingSession&) {
        std::optional<LocationSample> previous = store_->lastSample(tripId, userId);
        result.latest = isNewest(previous, *accepted.back().second.timestamp);
        double distanceKm = 0.0;

        std::vector<LocationSample> samples;
        samples.reserve(accepted.size());
        for (auto& entry : accepted) {
            distanceKm += measure(previous, entry.second).distanceKm;
            previous = entry.second;
            samples.push_back(entry.second);
        }

        store_->appendSamples(samples);
        result.distanceKm = distanceKm;
        return SessionDelta{static_cast<uint64_t>(samples.size()), distanceKm};
    });

    for (const auto& [index, sample] : accepted) {
        result.items[index].success = true;
        result.items[index].sampleId = sample.id;
    }
    result.successful = accepted.size();
    result.totalDistanceKm = session.totalDistanceKm;
    result.session = session;

    const LocationSample& latest = accepted.back().second;
    result.latestFiltered = privacyFilter_->apply(latest, session.privacySettings.trackingLevel);

    if (result.latest) {
        locationCache_->put(*result.latestFiltered);

        auto evaluation = evaluator_->evaluate(tripId, userId, latest.coordinates, *latest.timestamp);
        result.events = std::move(evaluation.events);
        result.geofenceError = evaluation.error;
    }

    std::cout << "[Ingestion] Batch for trip " << tripId << ": " << result.successful << "/"
              << result.processed << " stored, " << result.distanceKm << " km" << std::endl;
    return result;
}

} // namespace geotrack::domain
