#include "navigator/kalman_filter.h"

#include <algorithm>

using Eigen::Matrix2d;
using Eigen::MatrixXd;
using Eigen::Vector2d;
using Eigen::VectorXd;

namespace navigator {

namespace {
constexpr double kInitialVelocityVariance = 1.0;
}

KalmanFilter2D::KalmanFilter2D(const config::KalmanParams& params) : params_(params) {
    config::validate(params_);
    state_ = VectorXd::Zero(dimension());
    P_ = MatrixXd::Zero(dimension(), dimension());
}

Eigen::Index KalmanFilter2D::dimension() const {
    return params_.motionModel == config::MotionModel::ConstantVelocity ? 4 : 2;
}

double KalmanFilter2D::vx() const {
    return dimension() == 4 ? state_(2) : 0.0;
}

double KalmanFilter2D::vy() const {
    return dimension() == 4 ? state_(3) : 0.0;
}

void KalmanFilter2D::initialize(double x, double y, double measurementVariance, int64_t timeMs) {
    state_.setZero();
    state_(0) = x;
    state_(1) = y;

    P_.setZero();
    P_(0, 0) = measurementVariance;
    P_(1, 1) = measurementVariance;
    if (dimension() == 4) {
        P_(2, 2) = kInitialVelocityVariance;
        P_(3, 3) = kInitialVelocityVariance;
    }

    lastUpdateTime_ = timeMs;
    initialized_ = true;
}

void KalmanFilter2D::predict(double dt) {
    if (!initialized_)
        return;

    dt = std::max(dt, 0.0);
    const double q = params_.processVariance;

    if (dimension() == 2) {
        // x_k = x_{k-1}, шум растет линейно со временем
        P_ += Matrix2d::Identity() * (q * dt);
        return;
    }

    MatrixXd F = MatrixXd::Identity(4, 4);
    F(0, 2) = dt;
    F(1, 3) = dt;

    // непрерывный белый шум ускорения
    const double dt2 = dt * dt;
    const double dt3 = dt2 * dt;
    MatrixXd Q = MatrixXd::Zero(4, 4);
    Q(0, 0) = Q(1, 1) = dt3 / 3.0;
    Q(0, 2) = Q(2, 0) = Q(1, 3) = Q(3, 1) = dt2 / 2.0;
    Q(2, 2) = Q(3, 3) = dt;
    Q *= q;

    state_ = F * state_;
    P_ = F * P_ * F.transpose() + Q;
}

void KalmanFilter2D::update(double mx, double my, double measurementVariance, int64_t timeMs) {
    if (!initialized_) {
        initialize(mx, my, measurementVariance, timeMs);
        return;
    }

    const Eigen::Index n = dimension();
    MatrixXd H = MatrixXd::Zero(2, n);
    H(0, 0) = 1.0;
    H(1, 1) = 1.0;

    Matrix2d R = Matrix2d::Identity() * measurementVariance;
    Matrix2d S = H * P_ * H.transpose() + R;
    MatrixXd K = P_ * H.transpose() * S.inverse();

    Vector2d innovation(mx - state_(0), my - state_(1));
    state_ += K * innovation;

    // форма Джозефа, чтобы P оставалась симметричной
    MatrixXd IKH = MatrixXd::Identity(n, n) - K * H;
    P_ = IKH * P_ * IKH.transpose() + K * R * K.transpose();

    lastUpdateTime_ = timeMs;
}

}  // namespace navigator
