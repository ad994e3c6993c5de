#pragma once

#include "config/config.h"

#include <optional>
#include <vector>

namespace navigator {

// Расстояние до маяка с известной позицией
struct RangeMeasurement {
    double x = 0.0;
    double y = 0.0;
    double distance = 0.0;
    double weight = 1.0;
};

enum class FixMethod {
    Multilateration,  ///< >= 3 маяков, взвешенный МНК
    TwoBeacon,        ///< точка на отрезке между двумя маяками
    Centroid          ///< вырожденная геометрия
};

const char* toString(FixMethod method);

struct PositionFix {
    double x = 0.0;
    double y = 0.0;
    FixMethod method = FixMethod::Multilateration;
    double rmsResidual = 0.0;  ///< взвешенная СКО невязки дальностей, м
    double confidence = 1.0;   ///< (0, 1], масштабирует шум измерения фильтра
    bool degenerate = false;
};

/**
 * @brief Мультилатерация по набору дальностей
 *
 * Для >= 3 маяков система (x-xi)^2 + (y-yi)^2 = di^2 линеаризуется вычитанием
 * опорного уравнения (маяк с наибольшим весом) и решается взвешенным МНК.
 * Решение затем уточняется нелинейно через Ceres (если включено).
 */
class PositionResolver {
public:
    explicit PositionResolver(const config::ResolverSettings& settings = config::ResolverSettings());

    // Пусто, если пригодных дальностей меньше двух
    std::optional<PositionFix> resolve(const std::vector<RangeMeasurement>& ranges) const;

    const config::ResolverSettings& settings() const { return settings_; }

private:
    config::ResolverSettings settings_;

    PositionFix solveTwoBeacons(const RangeMeasurement& a, const RangeMeasurement& b) const;
    std::optional<PositionFix> solveLinear(const std::vector<RangeMeasurement>& ranges) const;
    void refine(const std::vector<RangeMeasurement>& ranges, PositionFix& fix) const;
    PositionFix centroid(const std::vector<RangeMeasurement>& ranges) const;

    double rmsResidual(const std::vector<RangeMeasurement>& ranges, double x, double y) const;
    double confidenceFor(double rms) const;
};

}  // namespace navigator
