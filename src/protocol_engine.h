#pragma once
// Общий контракт протоколов сенсоров CGM: автомат состояний и колбэки событий
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cgm_types.h"
#include "libs/random_source/random_source.h"

class ProtocolEngine {
 public:
  // Получатель событий протокола (обычно SessionOrchestrator)
  class Listener {
   public:
    virtual ~Listener() = default;
    virtual void onGlucoseData(const std::vector<GlucoseReading>& readings) = 0;
    virtual void onSensorInfo(const SensorInfo& info) = 0;
    virtual void onAuthenticationComplete(bool success) = 0;
    virtual void onError(const std::string& message) = 0;
    // Исходящие байты для транспорта
    virtual void sendBytes(const std::vector<uint8_t>& data) = 0;
  };

  // Источник текущего времени (мс, Unix)
  using Clock = std::function<int64_t()>;

  explicit ProtocolEngine(Clock clock);
  virtual ~ProtocolEngine() = default;

  ProtocolEngine(const ProtocolEngine&) = delete;
  ProtocolEngine& operator=(const ProtocolEngine&) = delete;

  virtual Generation generation() const = 0;

  // Подготовка к новой сессии; сведения о сенсоре могут отсутствовать
  virtual void initialize(const std::optional<SensorInfo>& info) = 0;
  // Очередная порция байтов от транспорта (в порядке приёма)
  virtual void handleBytes(const std::vector<uint8_t>& data) = 0;
  virtual void startAuthentication() = 0;
  virtual void requestGlucoseData() = 0;
  // Возврат в Idle из любого состояния, очистка буферов и ключей
  virtual void reset() = 0;

  ProtocolState state() const { return state_; }
  const std::optional<SensorInfo>& sensorInfo() const { return sensor_info_; }
  void setListener(Listener* listener) { listener_ = listener; }

 protected:
  void setState(ProtocolState next);
  int64_t now() const { return clock_(); }

  void emitGlucose(const std::vector<GlucoseReading>& readings);
  void emitSensorInfo(const SensorInfo& info);
  void emitAuthentication(bool success);
  void emitError(const std::string& message);
  void emitSend(const std::vector<uint8_t>& data);

  std::optional<SensorInfo> sensor_info_;

 private:
  Clock clock_;
  Listener* listener_ = nullptr;
  ProtocolState state_ = ProtocolState::Idle;
};

// Текущее время по системным часам (мс, Unix)
int64_t systemNowMs();

// Создание протокола для поколения сенсора
std::unique_ptr<ProtocolEngine> makeProtocolEngine(Generation generation,
                                                   ProtocolEngine::Clock clock,
                                                   const std::vector<uint8_t>& deviceInfo,
                                                   RandomSource::Fill random);
