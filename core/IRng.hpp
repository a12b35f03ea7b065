#pragma once

#include <cstdint>
#include <mutex>
#include <random>

namespace geotrack {

class IRng {
public:
    virtual ~IRng() = default;

    virtual double uniform(double min = 0.0, double max = 1.0) = 0;
    virtual int uniformInt(int min, int max) = 0;
};

/// Mersenne twister behind a mutex; callers may share one instance across threads.
class StandardRng : public IRng {
private:
    std::mt19937_64 gen_;
    std::mutex mutex_;

public:
    StandardRng() : gen_(std::random_device{}()) {}
    explicit StandardRng(uint64_t seed) : gen_(seed) {}

    double uniform(double min = 0.0, double max = 1.0) override {
        std::uniform_real_distribution<double> dist(min, max);
        std::lock_guard<std::mutex> lock(mutex_);
        return dist(gen_);
    }

    int uniformInt(int min, int max) override {
        std::uniform_int_distribution<int> dist(min, max);
        std::lock_guard<std::mutex> lock(mutex_);
        return dist(gen_);
    }
};

} // namespace geotrack
