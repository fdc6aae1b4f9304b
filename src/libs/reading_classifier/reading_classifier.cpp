#include "reading_classifier.h"

#include <algorithm>
#include <cmath>

namespace ReadingClassifier {
namespace {

bool byTime(const GlucoseReading& a, const GlucoseReading& b) {
  return a.timestampMs < b.timestampMs;
}

} // namespace

std::vector<GlucoseReading> windowOf(const std::vector<GlucoseReading>& readings) {
  std::vector<GlucoseReading> window;
  if (readings.empty()) return window;
  // Окно привязано к самому свежему показанию, а не к текущему времени
  int64_t newest = readings.front().timestampMs;
  for (const auto& r : readings) newest = std::max(newest, r.timestampMs);
  const int64_t cutoff = newest - WINDOW_MS;
  for (const auto& r : readings) {
    if (r.timestampMs >= cutoff && r.quality != GlucoseQuality::Unreliable) {
      window.push_back(r);
    }
  }
  std::stable_sort(window.begin(), window.end(), byTime);
  return window;
}

bool regress(const std::vector<GlucoseReading>& readings, Regression& out) {
  out = Regression{};
  if (readings.size() < MIN_READINGS) return false;
  const std::vector<GlucoseReading> window = windowOf(readings);
  if (window.size() < MIN_READINGS) return false;

  const double n = static_cast<double>(window.size());
  const int64_t first = window.front().timestampMs;
  double sumX = 0.0, sumY = 0.0, sumXY = 0.0, sumX2 = 0.0;
  for (const auto& r : window) {
    const double x = static_cast<double>(r.timestampMs - first) / 60000.0;  // минуты
    sumX += x;
    sumY += r.glucoseMgDl;
    sumXY += x * r.glucoseMgDl;
    sumX2 += x * x;
  }
  const double denominator = n * sumX2 - sumX * sumX;
  out.points = window.size();
  // Все точки с одной меткой времени: наклон 0, шум не оценивается
  if (std::fabs(denominator) < 0.0001) {
    out.slope = 0.0;
    out.residualStdDev = 0.0;
    return true;
  }
  const double slope = (n * sumXY - sumX * sumY) / denominator;
  const double intercept = (sumY - slope * sumX) / n;
  double ssr = 0.0;
  for (const auto& r : window) {
    const double x = static_cast<double>(r.timestampMs - first) / 60000.0;
    const double residual = r.glucoseMgDl - (intercept + slope * x);
    ssr += residual * residual;
  }
  out.slope = slope;
  out.residualStdDev = std::sqrt(ssr / (n - 2.0));
  return true;
}

TrendArrow trendFromSlope(double slope) {
  if (slope >= 3.0) return TrendArrow::DoubleUp;
  if (slope >= 2.0) return TrendArrow::SingleUp;
  if (slope >= 1.0) return TrendArrow::FortyFiveUp;
  if (slope >= -0.5) return TrendArrow::Flat;
  if (slope >= -1.0) return TrendArrow::FortyFiveDown;
  if (slope >= -2.0) return TrendArrow::SingleDown;
  return TrendArrow::DoubleDown;
}

TrendArrow classifyTrend(const std::vector<GlucoseReading>& readings) {
  Regression regression;
  if (!regress(readings, regression)) return TrendArrow::None;
  return trendFromSlope(regression.slope);
}

GlucoseQuality classifyNoise(const std::vector<GlucoseReading>& readings) {
  Regression regression;
  if (!regress(readings, regression)) return GlucoseQuality::Good;
  if (regression.residualStdDev > NOISE_UNRELIABLE) return GlucoseQuality::Unreliable;
  if (regression.residualStdDev > NOISE_DEGRADED) return GlucoseQuality::Degraded;
  return GlucoseQuality::Good;
}

std::vector<GlucoseReading> annotateTrends(const std::vector<GlucoseReading>& readings) {
  std::vector<GlucoseReading> sorted = readings;
  std::stable_sort(sorted.begin(), sorted.end(), byTime);
  std::vector<GlucoseReading> out;
  out.reserve(sorted.size());
  std::vector<GlucoseReading> prefix;
  prefix.reserve(sorted.size());
  for (const auto& reading : sorted) {
    prefix.push_back(reading);
    GlucoseReading annotated = reading;
    annotated.trend = classifyTrend(prefix);
    out.push_back(annotated);
  }
  return out;
}

} // namespace ReadingClassifier
