#include "navigator/tracker_state.h"

#include <algorithm>
#include <map>
#include <utility>

using namespace message_objects;

namespace navigator {

namespace {
constexpr double kMinConfidence = 1e-3;
}

PositionHistory::PositionHistory(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {}

void PositionHistory::push(const PositionSample& sample) {
    while (samples_.size() >= capacity_) {
        samples_.pop_front();
    }
    samples_.push_back(sample);
}

std::vector<PositionSample> PositionHistory::toVector() const {
    return {samples_.begin(), samples_.end()};
}

bool TrackerState::operator==(const TrackerState& other) const {
    auto sameBeacons = [](const std::vector<DetectedBeacon>& l, const std::vector<DetectedBeacon>& r) {
        return std::equal(l.begin(), l.end(), r.begin(), r.end(),
                          [](const DetectedBeacon& a, const DetectedBeacon& b) {
                              return a.id_ == b.id_ && a.rssi_ == b.rssi_ &&
                                     a.timestamp_ == b.timestamp_;
                          });
    };

    return trackerId == other.trackerId && position == other.position && vx == other.vx &&
           vy == other.vy && lastUpdateTime == other.lastUpdateTime &&
           lastKnownMeasurementTime == other.lastKnownMeasurementTime &&
           sameBeacons(lastDetectedBeacons, other.lastDetectedBeacons) &&
           positionHistory == other.positionHistory && lastFixMethod == other.lastFixMethod &&
           lastConfidence == other.lastConfidence && counters == other.counters;
}

const char* toString(TrackerStatus status) {
    switch (status) {
        case TrackerStatus::Unknown:
            return "unknown";
        case TrackerStatus::Active:
            return "active";
        case TrackerStatus::Stale:
            return "stale";
    }
    return "unknown";
}

const char* toString(UpdateResult result) {
    switch (result) {
        case UpdateResult::Updated:
            return "updated";
        case UpdateResult::Initialized:
            return "initialized";
        case UpdateResult::InsufficientData:
            return "insufficient_data";
        case UpdateResult::OutOfOrder:
            return "out_of_order";
        case UpdateResult::Failed:
            return "failed";
    }
    return "unknown";
}

TrackerStateMachine::TrackerStateMachine(std::string trackerId, const config::KalmanParams& kalman,
                                         const config::TrackerSettings& tracker)
    : filter_(kalman), kalman_(kalman), tracker_(tracker) {
    state_.trackerId = std::move(trackerId);
    state_.positionHistory = PositionHistory(tracker_.historyCapacity);
}

TrackerStatus TrackerStateMachine::status(int64_t nowMs) const {
    if (!state_.position)
        return TrackerStatus::Unknown;
    if (nowMs - state_.lastUpdateTime > tracker_.staleAfterMs)
        return TrackerStatus::Stale;
    return TrackerStatus::Active;
}

std::vector<RangeMeasurement> TrackerStateMachine::collectRanges(const TrackerReport& report,
                                                                 const RegistrySnapshot& registry,
                                                                 const DistanceEstimator& estimator,
                                                                 std::vector<ErrorEvent>& errors) {
    // Группируем замеры по маякам
    std::map<BeaconId, std::pair<const BLEBeacon*, std::vector<double>>> beaconDistances;

    for (const auto& observation : report.detectedBeacons_) {
        if (!DistanceEstimator::isValidRssi(observation.rssi_)) {
            errors.push_back({ErrorKind::InvalidSignal, report.trackerId_,
                              observation.id_.key() + " rssi " + std::to_string(observation.rssi_)});
            continue;
        }

        const BLEBeacon* beacon = registry.find(observation.id_);
        if (!beacon) {
            errors.push_back({ErrorKind::UnknownBeacon, report.trackerId_, observation.id_.key()});
            continue;
        }

        auto estimate = estimator.estimateDistance(observation.rssi_, *beacon,
                                                   registry.propagationFactor);
        // маяк с двумя идентичностями копим под основной
        auto& entry = beaconDistances[beacon->id_];
        entry.first = beacon;
        entry.second.push_back(estimate.distance);
    }

    std::vector<RangeMeasurement> ranges;
    ranges.reserve(beaconDistances.size());
    for (const auto& [id, entry] : beaconDistances) {
        double distance = calculateMedian(entry.second);
        ranges.push_back({entry.first->x_, entry.first->y_, distance, estimator.weightFor(distance)});
    }
    return ranges;
}

UpdateOutcome TrackerStateMachine::apply(const TrackerReport& report,
                                         const RegistrySnapshot& registry,
                                         const DistanceEstimator& estimator,
                                         const PositionResolver& resolver, int64_t nowMs) {
    UpdateOutcome outcome;

    if (state_.lastKnownMeasurementTime && report.timestamp_ < *state_.lastKnownMeasurementTime) {
        ++state_.counters.outOfOrder;
        outcome.result = UpdateResult::OutOfOrder;
        outcome.errors.push_back({ErrorKind::OutOfOrderReport, report.trackerId_,
                                  "timestamp " + std::to_string(report.timestamp_) + " < " +
                                      std::to_string(*state_.lastKnownMeasurementTime)});
        return outcome;
    }

    auto ranges = collectRanges(report, registry, estimator, outcome.errors);
    state_.counters.droppedObservations += outcome.errors.size();
    outcome.fix = resolver.resolve(ranges);

    ++state_.counters.acceptedReports;
    state_.lastUpdateTime = std::max(state_.lastUpdateTime, nowMs);
    state_.lastKnownMeasurementTime = report.timestamp_;
    state_.lastDetectedBeacons = report.detectedBeacons_;

    if (!outcome.fix) {
        ++state_.counters.insufficientData;
        outcome.result = UpdateResult::InsufficientData;
        outcome.errors.push_back({ErrorKind::InsufficientData, report.trackerId_,
                                  std::to_string(ranges.size()) + " usable beacon(s)"});
        return outcome;
    }

    const PositionFix& fix = *outcome.fix;
    if (fix.degenerate) {
        outcome.errors.push_back({ErrorKind::DegenerateGeometry, report.trackerId_,
                                  "fell back to weighted centroid"});
    }

    double variance = kalman_.measurementVariance / std::max(fix.confidence, kMinConfidence);

    bool reset = !filter_.initialized() ||
                 nowMs - filter_.lastUpdateTime() > tracker_.hardResetAfterMs;
    if (reset) {
        if (filter_.initialized())
            ++state_.counters.resets;
        filter_.initialize(fix.x, fix.y, variance, nowMs);
        outcome.result = UpdateResult::Initialized;
    } else {
        double dt = static_cast<double>(nowMs - filter_.lastUpdateTime()) / 1000.0;
        filter_.predict(dt);
        filter_.update(fix.x, fix.y, variance, std::max(nowMs, filter_.lastUpdateTime()));
        outcome.result = UpdateResult::Updated;
    }

    ++state_.counters.fixes;
    state_.position = Position{filter_.x(), filter_.y()};
    state_.vx = filter_.vx();
    state_.vy = filter_.vy();
    state_.lastFixMethod = fix.method;
    state_.lastConfidence = fix.confidence;
    state_.positionHistory.push({filter_.x(), filter_.y(), report.timestamp_});

    return outcome;
}

}  // namespace navigator
