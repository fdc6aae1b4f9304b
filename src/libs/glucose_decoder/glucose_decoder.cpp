#include "glucose_decoder.h"

#include <algorithm>
#include <string>

#include "default_settings.h"

namespace GlucoseDecoder {
namespace {

uint16_t readLe16(const uint8_t* p) {
  return static_cast<uint16_t>(p[0] | (static_cast<uint16_t>(p[1]) << 8));
}

uint32_t readLe32(const uint8_t* p) {
  return static_cast<uint32_t>(p[0]) |
         (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

// Серийный номер: обрезка пробелов, управляющих символов и NUL по краям
std::string readSerial(const std::vector<uint8_t>& data, size_t from, size_t to) {
  std::string serial(data.begin() + static_cast<std::ptrdiff_t>(from),
                     data.begin() + static_cast<std::ptrdiff_t>(to));
  auto isJunk = [](char ch) { return static_cast<unsigned char>(ch) <= ' '; };
  while (!serial.empty() && isJunk(serial.back())) serial.pop_back();
  size_t begin = 0;
  while (begin < serial.size() && isJunk(serial[begin])) ++begin;
  serial.erase(0, begin);
  serial.erase(std::remove(serial.begin(), serial.end(), '\0'), serial.end());
  return serial;
}

} // namespace

GlucoseQuality qualityFromFlags(uint16_t flags) {
  if (flags & FLAG_UNRELIABLE) return GlucoseQuality::Unreliable;
  if (flags & FLAG_DEGRADED) return GlucoseQuality::Degraded;
  return GlucoseQuality::Good;
}

std::optional<GlucoseReading> decodeGen2Record(const uint8_t* record, int64_t timestamp_ms) {
  const uint16_t raw = readLe16(record);
  if (raw == 0 || raw > GEN2_MAX_RAW) {
    return std::nullopt;   // вне допустимого диапазона
  }
  GlucoseReading reading;
  reading.timestampMs = timestamp_ms;
  reading.glucoseMgDl = static_cast<double>(raw);
  reading.rawValue = static_cast<double>(raw);
  reading.quality = qualityFromFlags(readLe16(record + 2));
  const uint16_t tempRaw = readLe16(record + 4);
  if (tempRaw > 0) {
    reading.temperatureC = tempRaw / 100.0;
  }
  return reading;
}

std::optional<GlucoseReading> decodeGen3Record(const uint8_t* record,
                                               const std::optional<int64_t>& sensor_start_ms,
                                               int64_t now_ms) {
  const uint16_t raw = readLe16(record);
  if (raw == 0 || raw > GEN3_MAX_RAW) {
    return std::nullopt;
  }
  const uint32_t seconds = readLe32(record + 4);
  GlucoseReading reading;
  reading.timestampMs = sensor_start_ms ? *sensor_start_ms + static_cast<int64_t>(seconds) * 1000
                                        : now_ms;
  reading.glucoseMgDl = raw / 10.0;
  reading.rawValue = static_cast<double>(raw);
  reading.quality = qualityFromFlags(readLe16(record + 2));
  return reading;
}

std::vector<GlucoseReading> decodeGen2Glucose(const std::vector<uint8_t>& data, int64_t now_ms) {
  std::vector<GlucoseReading> readings;
  if (data.size() < GEN2_MIN_GLUCOSE_BLOCK) {
    LOG_WARN("GlucoseDecoder: блок Gen2 слишком короткий (%u байт)",
             static_cast<unsigned>(data.size()));
    return readings;
  }
  const size_t trendIndex = data[GEN2_OFFSET_TREND_INDEX];
  const size_t historyIndex = data[GEN2_OFFSET_HISTORY_INDEX];
  constexpr int64_t kMinute = 60 * 1000;

  // Тренд: от самой свежей записи назад с шагом 1 минута
  for (size_t i = 0; i < GEN2_TREND_COUNT; ++i) {
    const size_t index = (trendIndex + GEN2_TREND_COUNT - i) % GEN2_TREND_COUNT;
    const size_t offset = GEN2_OFFSET_TREND_DATA + index * GEN2_RECORD_SIZE;
    if (offset + GEN2_RECORD_SIZE > data.size()) continue;
    if (auto reading = decodeGen2Record(data.data() + offset, now_ms - static_cast<int64_t>(i) * kMinute)) {
      readings.push_back(*reading);
    }
  }
  // История: продолжает окно тренда с шагом 15 минут
  for (size_t i = 0; i < GEN2_HISTORY_COUNT; ++i) {
    const size_t index = (historyIndex + GEN2_HISTORY_COUNT - i) % GEN2_HISTORY_COUNT;
    const size_t offset = GEN2_OFFSET_HISTORY_DATA + index * GEN2_RECORD_SIZE;
    if (offset + GEN2_RECORD_SIZE > data.size()) continue;
    const int64_t ts = now_ms - (static_cast<int64_t>(GEN2_TREND_COUNT) + static_cast<int64_t>(i) * 15) * kMinute;
    if (auto reading = decodeGen2Record(data.data() + offset, ts)) {
      readings.push_back(*reading);
    }
  }
  std::stable_sort(readings.begin(), readings.end(),
                   [](const GlucoseReading& a, const GlucoseReading& b) {
                     return a.timestampMs < b.timestampMs;
                   });
  DEBUG_LOG("GlucoseDecoder: Gen2 разобрано %u показаний", static_cast<unsigned>(readings.size()));
  return readings;
}

std::vector<GlucoseReading> decodeGen3Glucose(const std::vector<uint8_t>& data,
                                              const std::optional<int64_t>& sensor_start_ms,
                                              int64_t now_ms) {
  std::vector<GlucoseReading> readings;
  for (size_t offset = 0; offset + GEN3_RECORD_SIZE <= data.size(); offset += GEN3_RECORD_SIZE) {
    if (auto reading = decodeGen3Record(data.data() + offset, sensor_start_ms, now_ms)) {
      readings.push_back(*reading);
    }
  }
  return readings;
}

std::optional<SensorInfo> decodeGen2SensorInfo(const std::vector<uint8_t>& data, int64_t now_ms) {
  if (data.size() < GEN2_MIN_SENSOR_INFO) {
    return std::nullopt;
  }
  SensorInfo info;
  info.generation = Generation::Gen2;
  info.serialNumber = readSerial(data, 3, 13);
  const uint16_t minutes = readLe16(data.data() + 13);
  info.startTimeMs = now_ms - static_cast<int64_t>(minutes) * 60 * 1000;
  info.expiryTimeMs = info.startTimeMs + DefaultSettings::SENSOR_LIFESPAN_MS;
  const size_t patchLen = std::min(data.size(), GEN2_PATCH_INFO_MAX);
  info.patchInfo = std::vector<uint8_t>(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(patchLen));
  return info;
}

std::optional<SensorInfo> decodeGen3SensorInfo(const std::vector<uint8_t>& data, int64_t now_ms) {
  if (data.size() < GEN3_MIN_SENSOR_INFO) {
    return std::nullopt;
  }
  SensorInfo info;
  info.generation = Generation::Gen3;
  info.serialNumber = readSerial(data, 0, 10);
  const uint32_t ageMinutes = readLe32(data.data() + 14);
  const uint32_t maxLifeMinutes = readLe32(data.data() + 18);
  info.startTimeMs = now_ms - static_cast<int64_t>(ageMinutes) * 60 * 1000;
  if (maxLifeMinutes == 0) {
    // Нулевой срок нарушает expiry > start, берём стандартный
    LOG_WARN("GlucoseDecoder: maxLife=0, используется стандартный срок службы");
    info.expiryTimeMs = info.startTimeMs + DefaultSettings::SENSOR_LIFESPAN_MS;
  } else {
    info.expiryTimeMs = info.startTimeMs + static_cast<int64_t>(maxLifeMinutes) * 60 * 1000;
  }
  return info;
}

} // namespace GlucoseDecoder
