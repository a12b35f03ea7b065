#pragma once

#include <stdexcept>
#include <string>

namespace geotrack {

/**
 * @brief Failure categories raised by the tracking engine
 *
 * Validation kinds reject a single sample and never abort a batch.
 * Session kinds are state-machine violations surfaced to the caller as-is.
 * Infrastructure kinds come from the storage and cache ports.
 */
enum class ErrorKind {
    InvalidCoordinates,
    InvalidAccuracy,
    InvalidSpeed,
    SessionNotActive,
    SessionAlreadyActive,
    SessionNotFound,
    GeofenceGeometryError,
    InvalidSchedule,
    GeofenceNotFound,
    BatchTooLarge,
    StorageUnavailable,
    CacheUnavailable
};

std::string errorKindToString(ErrorKind kind);

bool isValidationError(ErrorKind kind);

class TrackingError : public std::runtime_error {
public:
    TrackingError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace geotrack
