#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace geotrack {

/**
 * @brief Fixed table of mutexes selected by key hash
 *
 * Two operations on the same key always contend on the same mutex, so a
 * read-modify-write done under forKey(key) is atomic per key. Unrelated keys
 * may share a stripe; that only costs throughput.
 */
class KeyedMutex {
public:
    explicit KeyedMutex(std::size_t stripes = 64) : stripes_(stripes == 0 ? 1 : stripes) {}

    KeyedMutex(const KeyedMutex&) = delete;
    KeyedMutex& operator=(const KeyedMutex&) = delete;

    std::mutex& forKey(const std::string& key) {
        return stripes_[std::hash<std::string>{}(key) % stripes_.size()];
    }

private:
    std::vector<std::mutex> stripes_;
};

} // namespace geotrack
