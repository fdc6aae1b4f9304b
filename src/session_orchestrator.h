#pragma once
// Оркестратор сессии: поиск -> соединение -> аутентификация -> поток показаний,
// переподключение с экспоненциальной задержкой и окно показаний для тренда
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "cgm_types.h"
#include "collaborators.h"
#include "protocol_engine.h"
#include "reading_window.h"
#include "transport_interface.h"
#include "libs/config_loader/config_loader.h"
#include "libs/random_source/random_source.h"
#include "libs/task_scheduler/task_scheduler.h"

class SessionOrchestrator : public ITransportListener, private ProtocolEngine::Listener {
 public:
  using Clock = std::function<int64_t()>;

  // transport и store должны жить дольше оркестратора; observer может быть nullptr
  SessionOrchestrator(ICgmTransport& transport,
                      IReadingStore& store,
                      ISessionObserver* observer,
                      const ConfigLoader::Config& config,
                      Clock clock = Clock(),
                      RandomSource::Fill random = RandomSource::Fill());
  ~SessionOrchestrator() override;

  SessionOrchestrator(const SessionOrchestrator&) = delete;
  SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

  // Поиск сенсора настроенного поколения
  bool startScan();
  // Явное подключение (сопряжение) к устройству; сбрасывает счётчик неудач
  bool connect(const std::string& deviceId);
  // Явное переподключение к последнему устройству, в том числе после Exhausted
  bool reconnect();
  // Отключение пользователем: таймеры, буферы и ключи очищаются синхронно
  void disconnect();
  // Выполнение наступивших таймеров
  void tick();

  // Задержка перед попыткой attempt (1, 2, ...): min(max, base * 2^(attempt-1))
  static uint32_t backoffDelayMs(uint32_t attempt, uint32_t base_ms, uint32_t max_ms);

  SessionState state() const;
  ConnectionState connectionState() const;
  uint32_t failedAttempts() const;
  std::vector<GlucoseReading> window() const;
  std::optional<GlucoseReading> currentReading() const;
  std::optional<SensorInfo> sensorInfo() const;
  SensorState sensorState() const;
  int64_t lastConnectionTimeMs() const;
  std::string deviceId() const;
  Generation generation() const;
  size_t pendingTimers() const;
  std::optional<ProtocolState> protocolState() const;

  // ITransportListener
  void onDeviceFound(const std::string& deviceId, Generation generation) override;
  void onConnected() override;
  void onDisconnected(const std::string& reason) override;
  void onBytesReceived(const std::vector<uint8_t>& data) override;
  void onError(TransportError code, const std::string& message) override;

 private:
  // ProtocolEngine::Listener
  void onGlucoseData(const std::vector<GlucoseReading>& readings) override;
  void onSensorInfo(const SensorInfo& info) override;
  void onAuthenticationComplete(bool success) override;
  void onError(const std::string& message) override;
  void sendBytes(const std::vector<uint8_t>& data) override;

  bool beginConnect();
  void failAttempt(ErrorKind kind, const std::string& reason, bool disconnectTransport);
  void scheduleReconnect(ErrorKind kind, const std::string& reason);
  void setPhase(SessionPhase phase, ErrorKind kind = ErrorKind::None, const std::string& reason = std::string());
  void cancelTimer(TaskScheduler::TaskId& id);
  void cancelAttemptTimers();
  void ensureSweep();
  void schedulePoll();
  void onPollDue();
  void onSweepDue();

  ICgmTransport& transport_;
  IReadingStore& store_;
  ISessionObserver* observer_;
  ConfigLoader::Config config_;
  Clock clock_;
  RandomSource::Fill random_;

  mutable std::recursive_mutex mutex_;     // последовательный доступ к состоянию
  TaskScheduler scheduler_;
  std::unique_ptr<ProtocolEngine> protocol_;
  ReadingWindow window_;
  SessionState state_;
  Generation generation_;
  std::string device_id_;
  std::optional<SensorInfo> sensor_info_;
  std::optional<GlucoseReading> current_;
  int64_t last_connection_ms_ = 0;
  uint32_t failed_attempts_ = 0;

  TaskScheduler::TaskId scan_timer_ = 0;
  TaskScheduler::TaskId connect_timer_ = 0;
  TaskScheduler::TaskId auth_timer_ = 0;
  TaskScheduler::TaskId reconnect_timer_ = 0;
  TaskScheduler::TaskId poll_timer_ = 0;
  TaskScheduler::TaskId sweep_timer_ = 0;
};
