#include "navigator/position_resolver.h"

#include <ceres/ceres.h>
#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <iterator>

using Eigen::Matrix2d;
using Eigen::MatrixXd;
using Eigen::Vector2d;
using Eigen::VectorXd;

namespace navigator {

namespace {

constexpr double kTwoBeaconPenalty = 0.5;
constexpr double kCentroidPenalty = 0.25;
constexpr double kCoincidentBeacons = 1e-9;

// Невязка дальности, вес = обратное СКО
struct RangeResidual {
    RangeResidual(double bx, double by, double di, double w) : bx(bx), by(by), di(di), weight(w) {}

    template <typename T>
    bool operator()(const T* const xy, T* residual) const {
        using std::sqrt;
        T dx = xy[0] - T(bx);
        T dy = xy[1] - T(by);
        T pred = sqrt(dx * dx + dy * dy + T(1e-12));
        residual[0] = T(weight) * (pred - T(di));
        return true;
    }

    double bx, by, di, weight;
};

bool usable(const RangeMeasurement& r) {
    return std::isfinite(r.x) && std::isfinite(r.y) && std::isfinite(r.distance) &&
           r.distance >= 0.0 && std::isfinite(r.weight) && r.weight > 0.0;
}

}  // namespace

const char* toString(FixMethod method) {
    switch (method) {
        case FixMethod::Multilateration:
            return "multilateration";
        case FixMethod::TwoBeacon:
            return "two_beacon";
        case FixMethod::Centroid:
            return "centroid";
    }
    return "unknown";
}

PositionResolver::PositionResolver(const config::ResolverSettings& settings)
    : settings_(settings) {
    config::validate(settings_);
}

std::optional<PositionFix> PositionResolver::resolve(
    const std::vector<RangeMeasurement>& ranges) const {
    std::vector<RangeMeasurement> valid;
    valid.reserve(ranges.size());
    std::copy_if(ranges.begin(), ranges.end(), std::back_inserter(valid), usable);

    if (valid.size() < 2)
        return std::nullopt;

    if (valid.size() == 2)
        return solveTwoBeacons(valid[0], valid[1]);

    auto fix = solveLinear(valid);
    if (!fix)
        return centroid(valid);

    if (settings_.refine)
        refine(valid, *fix);

    fix->rmsResidual = rmsResidual(valid, fix->x, fix->y);
    fix->confidence = confidenceFor(fix->rmsResidual);
    return fix;
}

PositionFix PositionResolver::solveTwoBeacons(const RangeMeasurement& a,
                                              const RangeMeasurement& b) const {
    Vector2d pa(a.x, a.y);
    Vector2d pb(b.x, b.y);
    double length = (pb - pa).norm();
    if (length < kCoincidentBeacons)
        return centroid({a, b});

    // min wa*(s - da)^2 + wb*(L - s - db)^2 по s в [0, L]
    double s = (a.weight * a.distance + b.weight * (length - b.distance)) / (a.weight + b.weight);
    s = std::clamp(s, 0.0, length);
    Vector2d p = pa + (pb - pa) * (s / length);

    PositionFix fix;
    fix.x = p.x();
    fix.y = p.y();
    fix.method = FixMethod::TwoBeacon;
    fix.rmsResidual = rmsResidual({a, b}, fix.x, fix.y);
    fix.confidence = confidenceFor(fix.rmsResidual) * kTwoBeaconPenalty;
    return fix;
}

std::optional<PositionFix> PositionResolver::solveLinear(
    const std::vector<RangeMeasurement>& ranges) const {
    auto reference = std::max_element(
        ranges.begin(), ranges.end(),
        [](const RangeMeasurement& l, const RangeMeasurement& r) { return l.weight < r.weight; });
    const RangeMeasurement& ref = *reference;
    const double refNorm = ref.x * ref.x + ref.y * ref.y;

    const Eigen::Index rows = static_cast<Eigen::Index>(ranges.size()) - 1;
    MatrixXd A(rows, 2);
    VectorXd b(rows);
    VectorXd w(rows);

    Eigen::Index row = 0;
    for (auto it = ranges.begin(); it != ranges.end(); ++it) {
        if (it == reference)
            continue;
        A(row, 0) = 2.0 * (it->x - ref.x);
        A(row, 1) = 2.0 * (it->y - ref.y);
        b(row) = ref.distance * ref.distance - it->distance * it->distance +
                 (it->x * it->x + it->y * it->y) - refNorm;
        w(row) = it->weight;
        ++row;
    }

    Matrix2d normal = A.transpose() * w.asDiagonal() * A;
    Eigen::SelfAdjointEigenSolver<Matrix2d> eigen(normal);
    double lmin = eigen.eigenvalues()(0);
    double lmax = eigen.eigenvalues()(1);
    if (!(lmax > 0.0) || lmin <= settings_.degenerateThreshold * lmax)
        return std::nullopt;

    Vector2d solution = normal.ldlt().solve(A.transpose() * w.asDiagonal() * b);
    if (!solution.allFinite())
        return std::nullopt;

    PositionFix fix;
    fix.x = solution.x();
    fix.y = solution.y();
    fix.method = FixMethod::Multilateration;
    return fix;
}

void PositionResolver::refine(const std::vector<RangeMeasurement>& ranges, PositionFix& fix) const {
    double xy[2] = {fix.x, fix.y};

    ceres::Problem problem;
    for (const auto& r : ranges) {
        ceres::CostFunction* cost = new ceres::AutoDiffCostFunction<RangeResidual, 1, 2>(
            new RangeResidual(r.x, r.y, r.distance, std::sqrt(r.weight)));
        ceres::LossFunction* loss = new ceres::HuberLoss(0.7);
        problem.AddResidualBlock(cost, loss, xy);
    }

    ceres::Solver::Options options;
    options.minimizer_progress_to_stdout = false;
    options.logging_type = ceres::SILENT;
    options.max_num_iterations = 100;
    options.function_tolerance = 1e-10;
    options.gradient_tolerance = 1e-12;
    options.linear_solver_type = ceres::DENSE_QR;
    options.num_threads = 1;

    ceres::Solver::Summary summary;
    ceres::Solve(options, &problem, &summary);

    if (summary.IsSolutionUsable() && std::isfinite(xy[0]) && std::isfinite(xy[1])) {
        fix.x = xy[0];
        fix.y = xy[1];
    }
}

PositionFix PositionResolver::centroid(const std::vector<RangeMeasurement>& ranges) const {
    double sx = 0.0, sy = 0.0, total = 0.0;
    for (const auto& r : ranges) {
        double w = 1.0 / std::max(r.distance, 1e-3);
        sx += w * r.x;
        sy += w * r.y;
        total += w;
    }

    PositionFix fix;
    fix.x = sx / total;
    fix.y = sy / total;
    fix.method = FixMethod::Centroid;
    fix.degenerate = true;
    fix.rmsResidual = rmsResidual(ranges, fix.x, fix.y);
    fix.confidence = confidenceFor(fix.rmsResidual) * kCentroidPenalty;
    return fix;
}

double PositionResolver::rmsResidual(const std::vector<RangeMeasurement>& ranges, double x,
                                     double y) const {
    double sum = 0.0, total = 0.0;
    for (const auto& r : ranges) {
        double err = std::hypot(x - r.x, y - r.y) - r.distance;
        sum += r.weight * err * err;
        total += r.weight;
    }
    return total > 0.0 ? std::sqrt(sum / total) : 0.0;
}

double PositionResolver::confidenceFor(double rms) const {
    return 1.0 / (1.0 + rms / settings_.residualScale);
}

}  // namespace navigator
