#pragma once
// Оценка тренда и шума по линейной регрессии в скользящем окне 15 минут
#include <cstdint>
#include <vector>

#include "cgm_types.h"

namespace ReadingClassifier {

constexpr int64_t WINDOW_MS = 15LL * 60 * 1000;  // окно анализа
constexpr size_t MIN_READINGS = 3;               // минимум точек для регрессии
constexpr double NOISE_DEGRADED = 5.0;           // СКО остатков, мг/дл
constexpr double NOISE_UNRELIABLE = 15.0;

// Результат регрессии: наклон в мг/дл за минуту и СКО остатков
struct Regression {
  double slope = 0.0;
  double residualStdDev = 0.0;
  size_t points = 0;
};

// Точки окна: не старше 15 минут от самого свежего показания, без Unreliable
std::vector<GlucoseReading> windowOf(const std::vector<GlucoseReading>& readings);

// Регрессия по окну; false если точек меньше трёх
bool regress(const std::vector<GlucoseReading>& readings, Regression& out);

// Стрелка по наклону
TrendArrow trendFromSlope(double slope);

TrendArrow classifyTrend(const std::vector<GlucoseReading>& readings);
GlucoseQuality classifyNoise(const std::vector<GlucoseReading>& readings);

// Каузальная разметка: тренд каждой точки по префиксу, заканчивающемуся на ней
std::vector<GlucoseReading> annotateTrends(const std::vector<GlucoseReading>& readings);

} // namespace ReadingClassifier
