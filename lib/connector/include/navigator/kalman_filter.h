#pragma once

#include "config/config.h"

#include <Eigen/Dense>
#include <cstdint>

namespace navigator {

/**
 * @brief Фильтр Калмана по позиции трекера
 *
 * Состояние: [x, y] для модели постоянной позиции или [x, y, vx, vy]
 * для модели постоянной скорости. Измерение всегда [x, y].
 * Принадлежит одному трекеру, синхронизация снаружи.
 */
class KalmanFilter2D {
public:
    explicit KalmanFilter2D(const config::KalmanParams& params = config::KalmanParams());

    bool initialized() const { return initialized_; }

    // Сброс состояния в измерение, ковариация позиции = measurementVariance
    void initialize(double x, double y, double measurementVariance, int64_t timeMs);

    // dt в секундах; отрицательный dt считается нулем
    void predict(double dt);

    void update(double mx, double my, double measurementVariance, int64_t timeMs);

    double x() const { return state_(0); }
    double y() const { return state_(1); }
    double vx() const;
    double vy() const;

    const Eigen::VectorXd& state() const { return state_; }
    const Eigen::MatrixXd& covariance() const { return P_; }

    int64_t lastUpdateTime() const { return lastUpdateTime_; }

    config::MotionModel model() const { return params_.motionModel; }
    const config::KalmanParams& params() const { return params_; }

private:
    config::KalmanParams params_;
    Eigen::VectorXd state_;
    Eigen::MatrixXd P_;
    bool initialized_ = false;
    int64_t lastUpdateTime_ = 0;

    Eigen::Index dimension() const;
};

}  // namespace navigator
