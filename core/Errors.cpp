#include "Errors.hpp"

namespace geotrack {

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidCoordinates: return "invalid_coordinates";
        case ErrorKind::InvalidAccuracy: return "invalid_accuracy";
        case ErrorKind::InvalidSpeed: return "invalid_speed";
        case ErrorKind::SessionNotActive: return "session_not_active";
        case ErrorKind::SessionAlreadyActive: return "session_already_active";
        case ErrorKind::SessionNotFound: return "session_not_found";
        case ErrorKind::GeofenceGeometryError: return "geofence_geometry_error";
        case ErrorKind::InvalidSchedule: return "invalid_schedule";
        case ErrorKind::GeofenceNotFound: return "geofence_not_found";
        case ErrorKind::BatchTooLarge: return "batch_too_large";
        case ErrorKind::StorageUnavailable: return "storage_unavailable";
        case ErrorKind::CacheUnavailable: return "cache_unavailable";
    }
    return "unknown";
}

bool isValidationError(ErrorKind kind) {
    return kind == ErrorKind::InvalidCoordinates ||
           kind == ErrorKind::InvalidAccuracy ||
           kind == ErrorKind::InvalidSpeed;
}

} // namespace geotrack
