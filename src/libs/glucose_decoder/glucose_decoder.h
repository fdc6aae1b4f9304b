#pragma once
// Декодеры двоичных записей глюкозы и сведений о сенсоре для обоих поколений
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "cgm_types.h"

namespace GlucoseDecoder {

// Размеры и смещения блока Gen2
constexpr size_t GEN2_RECORD_SIZE = 6;
constexpr size_t GEN2_TREND_COUNT = 16;
constexpr size_t GEN2_HISTORY_COUNT = 32;
constexpr size_t GEN2_OFFSET_TREND_INDEX = 26;
constexpr size_t GEN2_OFFSET_HISTORY_INDEX = 27;
constexpr size_t GEN2_OFFSET_TREND_DATA = 28;
constexpr size_t GEN2_OFFSET_HISTORY_DATA = GEN2_OFFSET_TREND_DATA + GEN2_TREND_COUNT * GEN2_RECORD_SIZE;
constexpr size_t GEN2_MIN_GLUCOSE_BLOCK = 344;
constexpr size_t GEN2_MIN_SENSOR_INFO = 20;
constexpr size_t GEN2_PATCH_INFO_MAX = 24;
constexpr uint32_t GEN2_MAX_RAW = 500;

// Записи Gen3
constexpr size_t GEN3_RECORD_SIZE = 8;
constexpr size_t GEN3_MIN_SENSOR_INFO = 24;
constexpr uint32_t GEN3_MAX_RAW = 5000;

// Флаги качества
constexpr uint16_t FLAG_UNRELIABLE = 0x8000;
constexpr uint16_t FLAG_DEGRADED = 0x4000;

GlucoseQuality qualityFromFlags(uint16_t flags);

// Одна запись Gen2 (глюкоза, флаги, температура). Отбраковка: пустой результат
std::optional<GlucoseReading> decodeGen2Record(const uint8_t* record, int64_t timestamp_ms);

// Одна запись Gen3 (глюкоза ×0.1, флаги, секунды от старта сенсора)
std::optional<GlucoseReading> decodeGen3Record(const uint8_t* record,
                                               const std::optional<int64_t>& sensor_start_ms,
                                               int64_t now_ms);

// Блок Gen2: тренд (16 × 1 мин) и история (32 × 15 мин), по возрастанию времени
std::vector<GlucoseReading> decodeGen2Glucose(const std::vector<uint8_t>& data, int64_t now_ms);

// Полезная нагрузка Gen3: последовательность 8-байтовых записей
std::vector<GlucoseReading> decodeGen3Glucose(const std::vector<uint8_t>& data,
                                              const std::optional<int64_t>& sensor_start_ms,
                                              int64_t now_ms);

// Сведения о сенсоре; нехватка байтов: пустой результат
std::optional<SensorInfo> decodeGen2SensorInfo(const std::vector<uint8_t>& data, int64_t now_ms);
std::optional<SensorInfo> decodeGen3SensorInfo(const std::vector<uint8_t>& data, int64_t now_ms);

} // namespace GlucoseDecoder
