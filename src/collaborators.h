#pragma once
// Внешние получатели событий сессии: хранилище и UI/оповещения
#include <optional>
#include <string>
#include <vector>

#include "cgm_types.h"

// Методы обоих интерфейсов вызываются из SessionOrchestrator под его мьютексом.
// В том же потоке обработчик может читать состояние оркестратора и вызывать его
// методы повторно. Передавать работу в другой поток и ждать там ответа от
// оркестратора внутри обработчика нельзя: это взаимная блокировка.

// Хранилище показаний и сведений о сенсоре.
// Вставка показаний идемпотентна по паре (timestamp, source).
class IReadingStore {
 public:
  virtual ~IReadingStore() = default;
  virtual void storeReadings(const std::vector<GlucoseReading>& readings, Generation source) = 0;
  virtual void storeSensorInfo(const SensorInfo& info) = 0;
  // Событие смены сенсора
  virtual void recordSensorChange(const SensorInfo& info) = 0;
  // Адрес устройства и время последнего соединения
  virtual void storeConnection(const std::string& deviceId, int64_t lastConnectionMs) = 0;
  // Ранее сохранённые сведения о сенсоре
  virtual std::optional<SensorInfo> loadSensorInfo() = 0;
};

// Наблюдатель состояния сессии (UI, планировщик оповещений)
class ISessionObserver {
 public:
  virtual ~ISessionObserver() = default;
  virtual void onSessionStateChanged(const SessionState& state) = 0;
  virtual void onCurrentReading(const GlucoseReading& reading) = 0;
  virtual void onSensorInfo(const SensorInfo& info, SensorState state) = 0;
  // Новый сенсор: сбросить таймеры оповещений
  virtual void onSensorChanged(const SensorInfo& info) = 0;
};
