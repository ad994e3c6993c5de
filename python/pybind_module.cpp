#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "message_objects/BLE.h"
#include "navigator/distance_estimator.h"
#include "navigator/kalman_filter.h"
#include "navigator/position_resolver.h"

namespace py = pybind11;

PYBIND11_MODULE(beacon_tracker_py, m) {
    m.doc() = "RSSI ranging, multilateration and Kalman smoothing";

    py::enum_<config::MotionModel>(m, "MotionModel")
        .value("CONSTANT_POSITION", config::MotionModel::ConstantPosition)
        .value("CONSTANT_VELOCITY", config::MotionModel::ConstantVelocity);

    py::class_<navigator::RangeMeasurement>(m, "RangeMeasurement")
        .def(py::init<>())
        .def(py::init([](double x, double y, double distance, double weight) {
                 return navigator::RangeMeasurement{x, y, distance, weight};
             }),
             py::arg("x"), py::arg("y"), py::arg("distance"), py::arg("weight") = 1.0)
        .def_readwrite("x", &navigator::RangeMeasurement::x)
        .def_readwrite("y", &navigator::RangeMeasurement::y)
        .def_readwrite("distance", &navigator::RangeMeasurement::distance)
        .def_readwrite("weight", &navigator::RangeMeasurement::weight);

    py::class_<navigator::PositionFix>(m, "PositionFix")
        .def_readonly("x", &navigator::PositionFix::x)
        .def_readonly("y", &navigator::PositionFix::y)
        .def_readonly("rms_residual", &navigator::PositionFix::rmsResidual)
        .def_readonly("confidence", &navigator::PositionFix::confidence)
        .def_readonly("degenerate", &navigator::PositionFix::degenerate)
        .def_property_readonly("method", [](const navigator::PositionFix& fix) {
            return std::string(navigator::toString(fix.method));
        });

    m.def(
        "estimate_distance",
        [](int rssi, int txPower, double n, double minDistance, double maxDistance) {
            config::DistanceSettings settings;
            settings.minDistance = minDistance;
            settings.maxDistance = maxDistance;
            message_objects::BLEBeacon beacon;
            beacon.txPower_ = txPower;
            auto estimate = navigator::DistanceEstimator(settings).estimateDistance(rssi, beacon, n);
            return py::make_tuple(estimate.distance, estimate.weight);
        },
        py::arg("rssi"), py::arg("tx_power"), py::arg("n") = 2.5, py::arg("min_distance") = 0.1,
        py::arg("max_distance") = 50.0);

    // None если маяков меньше двух
    m.def(
        "resolve",
        [](const std::vector<navigator::RangeMeasurement>& ranges, bool refine) {
            config::ResolverSettings settings;
            settings.refine = refine;
            return navigator::PositionResolver(settings).resolve(ranges);
        },
        py::arg("ranges"), py::arg("refine") = true);

    py::class_<navigator::KalmanFilter2D>(m, "KalmanFilter2D")
        .def(py::init([](double q, double r, config::MotionModel model) {
                 config::KalmanParams params;
                 params.processVariance = q;
                 params.measurementVariance = r;
                 params.motionModel = model;
                 return navigator::KalmanFilter2D(params);
             }),
             py::arg("process_variance") = 1.0, py::arg("measurement_variance") = 10.0,
             py::arg("model") = config::MotionModel::ConstantPosition)
        .def("predict", &navigator::KalmanFilter2D::predict, py::arg("dt"))
        .def(
            "update",
            [](navigator::KalmanFilter2D& self, double x, double y, double variance, int64_t timeMs) {
                self.update(x, y, variance, timeMs);
            },
            py::arg("x"), py::arg("y"), py::arg("variance"), py::arg("time_ms") = 0)
        .def_property_readonly("initialized", &navigator::KalmanFilter2D::initialized)
        .def("get_state", [](const navigator::KalmanFilter2D& self) {
            return py::make_tuple(self.x(), self.y(), self.vx(), self.vy());
        });
}
