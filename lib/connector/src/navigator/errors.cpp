#include "navigator/errors.h"

namespace navigator {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnknownBeacon:
            return "UnknownBeacon";
        case ErrorKind::InvalidSignal:
            return "InvalidSignal";
        case ErrorKind::InsufficientData:
            return "InsufficientData";
        case ErrorKind::OutOfOrderReport:
            return "OutOfOrderReport";
        case ErrorKind::DegenerateGeometry:
            return "DegenerateGeometry";
        case ErrorKind::QueueOverflow:
            return "QueueOverflow";
        case ErrorKind::ProcessingFailure:
            return "ProcessingFailure";
    }
    return "Unknown";
}

void NavigatorStats::count(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnknownBeacon:
            ++unknownBeacons;
            break;
        case ErrorKind::InvalidSignal:
            ++invalidSignals;
            break;
        case ErrorKind::InsufficientData:
            ++insufficientData;
            break;
        case ErrorKind::OutOfOrderReport:
            ++outOfOrder;
            break;
        case ErrorKind::DegenerateGeometry:
            ++degenerateGeometry;
            break;
        case ErrorKind::QueueOverflow:
            ++queueOverflows;
            break;
        case ErrorKind::ProcessingFailure:
            ++processingFailures;
            break;
    }
}

NavigatorStatsSnapshot NavigatorStats::snapshot() const {
    NavigatorStatsSnapshot s;
    s.reportsReceived = reportsReceived.load();
    s.reportsProcessed = reportsProcessed.load();
    s.fixes = fixes.load();
    s.unknownBeacons = unknownBeacons.load();
    s.invalidSignals = invalidSignals.load();
    s.insufficientData = insufficientData.load();
    s.outOfOrder = outOfOrder.load();
    s.degenerateGeometry = degenerateGeometry.load();
    s.queueOverflows = queueOverflows.load();
    s.processingFailures = processingFailures.load();
    return s;
}

}  // namespace navigator
