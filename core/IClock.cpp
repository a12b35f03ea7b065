#include "IClock.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace geotrack {

namespace {

// Howard Hinnant's days_from_civil.
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool parseOffsetSuffix(const std::string& text, size_t pos, int& offsetMinutes) {
    if (pos + 6 != text.size()) return false;
    char sign = text[pos];
    if (sign != '+' && sign != '-') return false;
    if (!std::isdigit(static_cast<unsigned char>(text[pos + 1])) ||
        !std::isdigit(static_cast<unsigned char>(text[pos + 2])) ||
        text[pos + 3] != ':' ||
        !std::isdigit(static_cast<unsigned char>(text[pos + 4])) ||
        !std::isdigit(static_cast<unsigned char>(text[pos + 5]))) {
        return false;
    }
    int hours = (text[pos + 1] - '0') * 10 + (text[pos + 2] - '0');
    int minutes = (text[pos + 4] - '0') * 10 + (text[pos + 5] - '0');
    if (hours > 14 || minutes > 59) return false;
    offsetMinutes = (sign == '-' ? -1 : 1) * (hours * 60 + minutes);
    return true;
}

} // namespace

std::string formatIso8601(Timestamp time) {
    auto time_t = std::chrono::system_clock::to_time_t(time);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
        time_t -= 1;
    }

    std::stringstream ss;

    // Use thread-safe gmtime_s on Windows, gmtime_r on other platforms
#ifdef _WIN32
    std::tm tm_buf{};
    if (gmtime_s(&tm_buf, &time_t) == 0) {
        ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    }
#else
    std::tm tm_buf{};
    if (gmtime_r(&time_t, &tm_buf)) {
        ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    }
#endif

    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

Timestamp parseIso8601(const std::string& text, int defaultOffsetMinutes) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;

    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6 ||
        consumed != 19) {
        throw std::invalid_argument("Malformed ISO-8601 timestamp: " + text);
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        throw std::invalid_argument("Out-of-range ISO-8601 timestamp: " + text);
    }

    size_t pos = static_cast<size_t>(consumed);
    int64_t millis = 0;

    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            throw std::invalid_argument("Malformed fractional seconds: " + text);
        }
        for (int i = digits; i < 3; ++i) {
            millis *= 10;
        }
    }

    int offsetMinutes = defaultOffsetMinutes;
    if (pos < text.size()) {
        if (text[pos] == 'Z' && pos + 1 == text.size()) {
            offsetMinutes = 0;
        } else if (!parseOffsetSuffix(text, pos, offsetMinutes)) {
            throw std::invalid_argument("Malformed timezone suffix: " + text);
        }
    }

    int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second - offsetMinutes * 60;

    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::milliseconds(seconds * 1000 + millis)));
}

std::optional<int> parseUtcOffsetMinutes(const std::string& timezone) {
    if (timezone.empty() || timezone == "UTC" || timezone == "Z" || timezone == "GMT") {
        return 0;
    }

    std::string offset = timezone;
    if (offset.rfind("UTC", 0) == 0) {
        offset = offset.substr(3);
    }

    int minutes = 0;
    if (!parseOffsetSuffix(offset, 0, minutes)) {
        return std::nullopt;
    }
    return minutes;
}

Timestamp fromEpochSeconds(int64_t seconds) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::seconds(seconds)));
}

int64_t toEpochSeconds(Timestamp time) {
    return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
}

} // namespace geotrack
