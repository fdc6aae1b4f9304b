#include <cassert>
#include <cstdint>
#include <vector>

#include "../src/libs/reading_classifier/reading_classifier.h"
#include "../src/reading_window.h"

namespace {

constexpr int64_t kStart = 1700000000000LL;
constexpr int64_t kMinute = 60000;

GlucoseReading at(int64_t minute, double value, GlucoseQuality quality = GlucoseQuality::Good) {
  GlucoseReading r;
  r.timestampMs = kStart + minute * kMinute;
  r.glucoseMgDl = value;
  r.quality = quality;
  return r;
}

std::vector<GlucoseReading> series(double slope, int count) {
  std::vector<GlucoseReading> out;
  for (int i = 0; i < count; ++i) out.push_back(at(i, 100.0 + slope * i));
  return out;
}

void testTrendBuckets() {
  using ReadingClassifier::classifyTrend;
  assert(classifyTrend({}) == TrendArrow::None);
  assert(classifyTrend(series(2.0, 2)) == TrendArrow::None);
  assert(classifyTrend(series(2.0, 5)) == TrendArrow::SingleUp);
  assert(classifyTrend(series(3.5, 5)) == TrendArrow::DoubleUp);
  assert(classifyTrend(series(1.5, 5)) == TrendArrow::FortyFiveUp);
  assert(classifyTrend(series(-0.75, 5)) == TrendArrow::FortyFiveDown);
  assert(classifyTrend(series(-1.5, 5)) == TrendArrow::SingleDown);
  assert(classifyTrend(series(-2.5, 5)) == TrendArrow::DoubleDown);
  assert(classifyTrend(series(-4.0, 5)) == TrendArrow::DoubleDown);

  // Ровный ряд с дрожанием ±0.1
  std::vector<GlucoseReading> flat{at(0, 100.0), at(1, 100.1), at(2, 99.9), at(3, 100.1), at(4, 99.9)};
  assert(classifyTrend(flat) == TrendArrow::Flat);

  // Границы корзин
  assert(ReadingClassifier::trendFromSlope(3.0) == TrendArrow::DoubleUp);
  assert(ReadingClassifier::trendFromSlope(1.0) == TrendArrow::FortyFiveUp);
  assert(ReadingClassifier::trendFromSlope(-0.5) == TrendArrow::Flat);
  assert(ReadingClassifier::trendFromSlope(-1.0) == TrendArrow::FortyFiveDown);
  assert(ReadingClassifier::trendFromSlope(-2.0) == TrendArrow::SingleDown);
}

void testUnreliableExcluded() {
  auto readings = series(2.0, 3);
  readings.push_back(at(3, 400.0, GlucoseQuality::Unreliable));
  assert(ReadingClassifier::classifyTrend(readings) == TrendArrow::SingleUp);

  std::vector<GlucoseReading> mostlyBad{at(0, 100.0), at(1, 102.0),
                                        at(2, 300.0, GlucoseQuality::Unreliable),
                                        at(3, 10.0, GlucoseQuality::Unreliable)};
  assert(ReadingClassifier::classifyTrend(mostlyBad) == TrendArrow::None);
  assert(ReadingClassifier::classifyNoise(mostlyBad) == GlucoseQuality::Good);
}

void testWindow() {
  // Старые точки за пределами 15 минут от самой свежей не учитываются
  std::vector<GlucoseReading> readings{at(0, 300.0), at(5, 250.0)};
  for (int i = 0; i < 4; ++i) readings.push_back(at(30 + i, 100.0 + 2.0 * i));
  assert(ReadingClassifier::windowOf(readings).size() == 4);
  assert(ReadingClassifier::classifyTrend(readings) == TrendArrow::SingleUp);

  // Вертикальный набор (одна метка): наклон 0
  std::vector<GlucoseReading> same{at(1, 100.0), at(1, 120.0), at(1, 140.0)};
  assert(ReadingClassifier::classifyTrend(same) == TrendArrow::Flat);
  std::vector<GlucoseReading> spread{at(1, 100.0), at(1, 140.0), at(1, 180.0)};
  assert(ReadingClassifier::classifyTrend(spread) == TrendArrow::Flat);
  assert(ReadingClassifier::classifyNoise(spread) == GlucoseQuality::Good);
}

void testNoise() {
  using ReadingClassifier::classifyNoise;
  assert(classifyNoise(series(2.0, 6)) == GlucoseQuality::Good);
  std::vector<GlucoseReading> moderate, heavy;
  for (int i = 0; i < 6; ++i) {
    moderate.push_back(at(i, (i % 2) ? 112.0 : 100.0));   // СКО остатков ≈ 7
    heavy.push_back(at(i, (i % 2) ? 140.0 : 100.0));      // СКО остатков ≈ 23
  }
  assert(classifyNoise(moderate) == GlucoseQuality::Degraded);
  assert(classifyNoise(heavy) == GlucoseQuality::Unreliable);
  assert(classifyNoise(series(1.0, 2)) == GlucoseQuality::Good);
}

void testAnnotate() {
  // Порядок входа не важен, разметка каузальная
  std::vector<GlucoseReading> input{at(3, 106.0), at(0, 100.0), at(2, 104.0), at(1, 102.0)};
  auto out = ReadingClassifier::annotateTrends(input);
  assert(out.size() == 4);
  assert(out[0].timestampMs == kStart);
  assert(out[0].trend == TrendArrow::None);
  assert(out[1].trend == TrendArrow::None);
  assert(out[2].trend == TrendArrow::SingleUp);
  assert(out[3].trend == TrendArrow::SingleUp);

  // Будущий скачок не влияет на более раннюю точку
  std::vector<GlucoseReading> jump{at(0, 100.0), at(1, 100.0), at(2, 100.0), at(3, 200.0)};
  auto marked = ReadingClassifier::annotateTrends(jump);
  assert(marked[2].trend == TrendArrow::Flat);
  assert(marked[3].trend == TrendArrow::DoubleUp);
}

void testReadingWindow() {
  ReadingWindow window(30 * kMinute);
  window.insert(at(10, 110.0));
  window.insert(at(0, 100.0));
  window.insert(at(5, 105.0));
  window.insert(at(5, 106.0));              // та же метка: замена
  assert(window.size() == 3);
  assert(window.readings()[1].glucoseMgDl == 106.0);
  assert(window.prefixUntil(kStart + 5 * kMinute).size() == 2);
  assert(window.prefixUntil(kStart - 1).empty());
  assert(window.prune(kStart + 34 * kMinute) == 1);   // граница: старше 4-й минуты
  assert(window.size() == 2);
  assert(window.readings().front().timestampMs == kStart + 5 * kMinute);
  window.clear();
  assert(window.empty());
}

} // namespace

int main() {
  testTrendBuckets();
  testUnreliableExcluded();
  testWindow();
  testNoise();
  testAnnotate();
  testReadingWindow();
  return 0;
}
