#pragma once
// Общая модель данных: показания глюкозы, сведения о сенсоре и состояния автоматов

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Поколение сенсора
enum class Generation : uint8_t {
  Gen2,   // challenge/unlock, AES-CBC
  Gen3    // потоковая аутентификация, AES-CTR
};

// Стрелка тренда (скорость изменения глюкозы)
enum class TrendArrow : uint8_t {
  None,
  DoubleUp,
  SingleUp,
  FortyFiveUp,
  Flat,
  FortyFiveDown,
  SingleDown,
  DoubleDown
};

// Качество показания
enum class GlucoseQuality : uint8_t {
  Good,
  Degraded,
  Unreliable
};

// Состояние автомата протокола
enum class ProtocolState : uint8_t {
  Idle,
  Authenticating,
  Authenticated,
  Reading,
  Error
};

// Фаза сессии, которой владеет SessionOrchestrator
enum class SessionPhase : uint8_t {
  Idle,
  Scanning,
  Connecting,
  Authenticating,
  Connected,
  Reconnecting,
  Error
};

// Классификация ошибок
enum class ErrorKind : uint8_t {
  None,
  MalformedInput,
  CryptoFailure,
  ProtocolViolation,
  TransportFailure,
  AuthenticationFailure,
  Timeout,
  Exhausted
};

// Упрощённое состояние соединения для UI и оповещений
enum class ConnectionState : uint8_t {
  Disconnected,
  Scanning,
  Connecting,
  Authenticating,
  Connected,
  Reconnecting
};

// Состояние сенсора по времени жизни
enum class SensorState : uint8_t {
  None,
  Starting,
  Ready,
  Ending,
  Expired
};

// Одно показание глюкозы
struct GlucoseReading {
  int64_t timestampMs = 0;                       // метка времени (мс, Unix)
  double glucoseMgDl = 0.0;                      // значение, мг/дл
  TrendArrow trend = TrendArrow::None;           // заполняется классификатором
  GlucoseQuality quality = GlucoseQuality::Good; // качество по флагам записи
  std::optional<double> rawValue;                // сырое значение из записи
  std::optional<double> temperatureC;            // температура сенсора, °C
};

// Сведения о сенсоре
struct SensorInfo {
  std::string serialNumber;                      // серийный номер
  int64_t startTimeMs = 0;                       // начало работы
  int64_t expiryTimeMs = 0;                      // окончание срока службы
  Generation generation = Generation::Gen2;      // поколение
  std::optional<std::string> firmwareVersion;    // версия прошивки, если известна
  std::optional<std::vector<uint8_t>> patchInfo; // ключевой материал Gen2 (NFC)
};

// Состояние сессии с причиной ошибки
struct SessionState {
  SessionPhase phase = SessionPhase::Idle;
  ErrorKind error = ErrorKind::None;
  std::string reason;                            // пояснение, только для журнала
};

// Текстовые имена для журналов и статусов
const char* toString(Generation generation);
const char* toString(TrendArrow trend);
const char* toString(GlucoseQuality quality);
const char* toString(ProtocolState state);
const char* toString(SessionPhase phase);
const char* toString(ErrorKind kind);
const char* toString(ConnectionState state);
const char* toString(SensorState state);

// Проекция фазы сессии на состояние соединения
ConnectionState toConnectionState(SessionPhase phase);

// Состояние сенсора на момент now_ms; без сведений: None
SensorState deriveSensorState(const std::optional<SensorInfo>& info, int64_t now_ms);
