#include "navigator/distance_estimator.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace navigator {

DistanceEstimator::DistanceEstimator(const config::DistanceSettings& settings)
    : settings_(settings) {
    config::validate(settings_);
}

DistanceEstimate DistanceEstimator::estimateDistance(int rssi,
                                                     const message_objects::BLEBeacon& beacon,
                                                     double propagationFactor) const {
    double ratio = static_cast<double>(beacon.txPower_ - rssi) / (10.0 * propagationFactor);
    double distance = std::pow(10.0, ratio);
    distance = std::clamp(distance, settings_.minDistance, settings_.maxDistance);

    return {distance, weightFor(distance)};
}

double DistanceEstimator::weightFor(double distance) const {
    double d = std::max(distance, settings_.weightEpsilon);
    return 1.0 / (d * d);
}

double calculateMedian(std::vector<double> values) {
    if (values.empty())
        throw std::invalid_argument("Empty vector for median");

    std::sort(values.begin(), values.end());

    auto median = [](const std::vector<double>& sorted) {
        size_t n = sorted.size() / 2;
        if (sorted.size() % 2 == 1)
            return sorted[n];
        return (sorted[n - 1] + sorted[n]) / 2.0;
    };

    if (values.size() < 4)
        return median(values);

    size_t n = values.size();
    double q1 = values[n / 4];
    double q3 = values[3 * n / 4];
    double iqr = q3 - q1;

    std::vector<double> filtered;
    if (iqr > 0.1) {
        for (double v : values) {
            if (v >= q1 - 1.5 * iqr && v <= q3 + 1.5 * iqr)
                filtered.push_back(v);
        }
    }

    // отсеяли слишком много - берем все
    if (filtered.empty() || filtered.size() < values.size() / 2)
        return median(values);

    return median(filtered);
}

}  // namespace navigator
