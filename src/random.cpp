#include "lateval/random.h"

namespace lateval {

EngineRandomSource::EngineRandomSource() : engine_(std::random_device{}()) {}

EngineRandomSource::EngineRandomSource(uint64_t seed) : engine_(seed) {}

double EngineRandomSource::normal(double mean, double sd) {
    if (sd == 0.0) return mean;
    std::normal_distribution<double> dist(mean, sd);
    return dist(engine_);
}

RandomSource& processRandomSource() {
    static EngineRandomSource source;
    return source;
}

}  // namespace lateval
