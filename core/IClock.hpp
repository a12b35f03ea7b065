#pragma once

#include "Types.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace geotrack {

class IClock {
public:
    virtual ~IClock() = default;

    virtual Timestamp now() const = 0;

    uint64_t epochSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            now().time_since_epoch()).count();
    }
};

class SystemClock : public IClock {
public:
    Timestamp now() const override {
        return std::chrono::system_clock::now();
    }
};

/// Formats as "YYYY-MM-DDTHH:MM:SS.mmmZ".
std::string formatIso8601(Timestamp time);

/**
 * @brief Parse an ISO-8601 date-time
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds and an
 * optional "Z" or "+HH:MM" suffix. Strings without a suffix are wall-clock
 * times at @p defaultOffsetMinutes east of UTC.
 *
 * @throws std::invalid_argument on malformed input
 */
Timestamp parseIso8601(const std::string& text, int defaultOffsetMinutes = 0);

/**
 * @brief Parse a fixed-offset timezone name
 * @return Offset in minutes east of UTC for "UTC", "Z", "+HH:MM",
 *         "-HH:MM", "UTC+HH:MM", "UTC-HH:MM"; std::nullopt otherwise
 */
std::optional<int> parseUtcOffsetMinutes(const std::string& timezone);

Timestamp fromEpochSeconds(int64_t seconds);
int64_t toEpochSeconds(Timestamp time);

} // namespace geotrack
