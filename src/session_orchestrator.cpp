#include "session_orchestrator.h"

#include <algorithm>

#include "default_settings.h"
#include "libs/reading_classifier/reading_classifier.h"
#include "libs/status_log/status_log.h"

using Lock = std::lock_guard<std::recursive_mutex>;

SessionOrchestrator::SessionOrchestrator(ICgmTransport& transport,
                                         IReadingStore& store,
                                         ISessionObserver* observer,
                                         const ConfigLoader::Config& config,
                                         Clock clock,
                                         RandomSource::Fill random)
    : transport_(transport),
      store_(store),
      observer_(observer),
      config_(config),
      clock_(clock ? std::move(clock) : Clock(systemNowMs)),
      random_(random ? std::move(random) : RandomSource::secure()),
      window_(config.session.retentionMs),
      generation_(config.sensor.generation) {
  sensor_info_ = store_.loadSensorInfo();
  if (sensor_info_) {
    LOG_INFO("SessionOrchestrator: загружены сведения о сенсоре %s",
             sensor_info_->serialNumber.c_str());
  }
}

SessionOrchestrator::~SessionOrchestrator() {
  scheduler_.cancelAll();
  if (protocol_) {
    protocol_->setListener(nullptr);
    protocol_->reset();
  }
}

uint32_t SessionOrchestrator::backoffDelayMs(uint32_t attempt, uint32_t base_ms, uint32_t max_ms) {
  if (attempt == 0) attempt = 1;
  const uint32_t shift = attempt - 1;
  if (shift >= 31) return max_ms;
  const uint64_t delay = static_cast<uint64_t>(base_ms) << shift;
  return delay > max_ms ? max_ms : static_cast<uint32_t>(delay);
}

// ---------------------------------------------------------------------------
// Управляющие операции

bool SessionOrchestrator::startScan() {
  Lock lock(mutex_);
  if (state_.phase != SessionPhase::Idle && state_.phase != SessionPhase::Error) {
    LOG_WARN("SessionOrchestrator: поиск невозможен в состоянии %s", toString(state_.phase));
    return false;
  }
  failed_attempts_ = 0;
  setPhase(SessionPhase::Scanning);
  ensureSweep();
  cancelTimer(scan_timer_);
  scan_timer_ = scheduler_.schedule(clock_() + config_.session.scanTimeoutMs, "scan-timeout", [this]() {
    scan_timer_ = 0;
    if (state_.phase != SessionPhase::Scanning) return;
    LOG_WARN("SessionOrchestrator: сенсор не найден за %u мс",
             static_cast<unsigned>(config_.session.scanTimeoutMs));
    transport_.stopScan();
    setPhase(SessionPhase::Idle, ErrorKind::Timeout, "scan timeout");
  });
  if (!transport_.startScan(generation_)) {
    cancelTimer(scan_timer_);
    setPhase(SessionPhase::Error, ErrorKind::TransportFailure, "scan failed to start");
    return false;
  }
  return true;
}

bool SessionOrchestrator::connect(const std::string& deviceId) {
  Lock lock(mutex_);
  if (deviceId.empty()) {
    LOG_WARN("SessionOrchestrator: пустой идентификатор устройства");
    return false;
  }
  if (state_.phase == SessionPhase::Connecting ||
      state_.phase == SessionPhase::Authenticating ||
      state_.phase == SessionPhase::Connected) {
    LOG_WARN("SessionOrchestrator: соединение уже выполняется (%s)", toString(state_.phase));
    return false;
  }
  if (state_.phase == SessionPhase::Scanning) {
    cancelTimer(scan_timer_);
    transport_.stopScan();
  }
  cancelTimer(reconnect_timer_);
  device_id_ = deviceId;
  failed_attempts_ = 0;
  ensureSweep();
  return beginConnect();
}

bool SessionOrchestrator::reconnect() {
  std::string id;
  {
    Lock lock(mutex_);
    id = device_id_;
  }
  if (id.empty()) {
    LOG_WARN("SessionOrchestrator: нет сохранённого устройства для переподключения");
    return false;
  }
  return connect(id);
}

void SessionOrchestrator::disconnect() {
  Lock lock(mutex_);
  const SessionPhase previous = state_.phase;
  scheduler_.cancelAll();
  scan_timer_ = connect_timer_ = auth_timer_ = reconnect_timer_ = poll_timer_ = sweep_timer_ = 0;
  if (protocol_) {
    protocol_->reset();
  }
  failed_attempts_ = 0;
  // Фаза меняется до вызова транспорта, чтобы его onDisconnected был проигнорирован
  setPhase(SessionPhase::Idle);
  if (previous == SessionPhase::Scanning) {
    transport_.stopScan();
  } else if (previous != SessionPhase::Idle) {
    transport_.disconnect();
  }
  LOG_INFO("SessionOrchestrator: отключено пользователем");
}

void SessionOrchestrator::tick() {
  Lock lock(mutex_);
  scheduler_.poll(clock_());
}

// ---------------------------------------------------------------------------
// Последовательность соединения

bool SessionOrchestrator::beginConnect() {
  cancelAttemptTimers();
  if (!protocol_ || protocol_->generation() != generation_) {
    std::vector<uint8_t> deviceInfo(config_.sensor.deviceInfo.begin(), config_.sensor.deviceInfo.end());
    protocol_ = makeProtocolEngine(generation_, clock_, deviceInfo, random_);
    protocol_->setListener(this);
  }
  protocol_->initialize(sensor_info_);
  setPhase(SessionPhase::Connecting);
  connect_timer_ = scheduler_.schedule(clock_() + config_.session.connectTimeoutMs, "connect-timeout", [this]() {
    connect_timer_ = 0;
    if (state_.phase != SessionPhase::Connecting) return;
    LOG_WARN("SessionOrchestrator: тайм-аут соединения");
    failAttempt(ErrorKind::Timeout, "connect timeout", true);
  });
  LOG_INFO("SessionOrchestrator: соединение с %s (попытка %u)", device_id_.c_str(),
           static_cast<unsigned>(failed_attempts_ + 1));
  if (!transport_.connect(device_id_)) {
    LOG_ERROR("SessionOrchestrator: транспорт отклонил соединение");
    failAttempt(ErrorKind::TransportFailure, "connect rejected", false);
    return false;
  }
  return true;
}

void SessionOrchestrator::failAttempt(ErrorKind kind, const std::string& reason, bool disconnectTransport) {
  cancelAttemptTimers();
  if (protocol_) {
    protocol_->reset();
  }
  // Сначала планируем повтор: onDisconnected от транспорта придёт уже в Reconnecting
  scheduleReconnect(kind, reason);
  if (disconnectTransport) {
    transport_.disconnect();
  }
}

void SessionOrchestrator::scheduleReconnect(ErrorKind kind, const std::string& reason) {
  cancelTimer(reconnect_timer_);
  if (!config_.session.autoReconnect) {
    setPhase(SessionPhase::Error, kind, reason);
    return;
  }
  ++failed_attempts_;
  if (failed_attempts_ >= config_.session.reconnectAttempts) {
    LOG_ERROR("SessionOrchestrator: соединение не установлено после %u попыток",
              static_cast<unsigned>(failed_attempts_));
    scheduler_.cancelAll();
    scan_timer_ = connect_timer_ = auth_timer_ = reconnect_timer_ = poll_timer_ = sweep_timer_ = 0;
    setPhase(SessionPhase::Error, ErrorKind::Exhausted,
             "Connection failed after " + std::to_string(failed_attempts_) + " attempts");
    return;
  }
  const uint32_t delay = backoffDelayMs(failed_attempts_ + 1, config_.session.backoffBaseMs,
                                        config_.session.backoffMaxMs);
  LOG_WARN("SessionOrchestrator: %s, повтор через %u мс (попытка %u)", reason.c_str(),
           static_cast<unsigned>(delay), static_cast<unsigned>(failed_attempts_ + 1));
  setPhase(SessionPhase::Reconnecting, kind, reason);
  reconnect_timer_ = scheduler_.schedule(clock_() + delay, "reconnect", [this]() {
    reconnect_timer_ = 0;
    if (state_.phase != SessionPhase::Reconnecting) return;
    beginConnect();
  });
}

void SessionOrchestrator::setPhase(SessionPhase phase, ErrorKind kind, const std::string& reason) {
  const bool changed = state_.phase != phase || state_.error != kind || state_.reason != reason;
  state_.phase = phase;
  state_.error = kind;
  state_.reason = reason;
  if (!changed) return;
  std::string line = std::string("SESSION ") + toString(phase);
  if (kind != ErrorKind::None) {
    line += std::string(" ") + toString(kind);
  }
  StatusLog::logStatus(line);
  if (observer_) observer_->onSessionStateChanged(state_);
}

void SessionOrchestrator::cancelTimer(TaskScheduler::TaskId& id) {
  if (id != 0) {
    scheduler_.cancel(id);
    id = 0;
  }
}

void SessionOrchestrator::cancelAttemptTimers() {
  cancelTimer(connect_timer_);
  cancelTimer(auth_timer_);
  cancelTimer(poll_timer_);
  cancelTimer(reconnect_timer_);
}

void SessionOrchestrator::ensureSweep() {
  if (sweep_timer_ != 0 || config_.session.cleanupIntervalMs == 0) return;
  sweep_timer_ = scheduler_.schedule(clock_() + config_.session.cleanupIntervalMs, "window-sweep",
                                     [this]() { onSweepDue(); });
}

void SessionOrchestrator::onSweepDue() {
  sweep_timer_ = 0;
  const size_t removed = window_.prune(clock_());
  if (removed > 0) {
    DEBUG_LOG("SessionOrchestrator: из окна удалено %u показаний", static_cast<unsigned>(removed));
  }
  ensureSweep();
}

void SessionOrchestrator::schedulePoll() {
  cancelTimer(poll_timer_);
  if (generation_ != Generation::Gen2 || config_.session.pollIntervalMs == 0) return;
  poll_timer_ = scheduler_.schedule(clock_() + config_.session.pollIntervalMs, "gen2-poll",
                                    [this]() { onPollDue(); });
}

void SessionOrchestrator::onPollDue() {
  poll_timer_ = 0;
  if (state_.phase != SessionPhase::Connected || !protocol_) return;
  if (protocol_->state() == ProtocolState::Reading) {
    // Ответ на предыдущий запрос так и не пришёл
    failAttempt(ErrorKind::Timeout, "no glucose response", true);
    return;
  }
  protocol_->requestGlucoseData();
  schedulePoll();
}

// ---------------------------------------------------------------------------
// События транспорта

void SessionOrchestrator::onDeviceFound(const std::string& deviceId, Generation generation) {
  Lock lock(mutex_);
  if (state_.phase != SessionPhase::Scanning) {
    DEBUG_LOG("SessionOrchestrator: найдено устройство %s вне поиска", deviceId.c_str());
    return;
  }
  if (generation != generation_) {
    DEBUG_LOG("SessionOrchestrator: устройство %s другого поколения (%s)", deviceId.c_str(),
              toString(generation));
    return;
  }
  cancelTimer(scan_timer_);
  transport_.stopScan();
  device_id_ = deviceId;
  LOG_INFO("SessionOrchestrator: найден сенсор %s", deviceId.c_str());
  beginConnect();
}

void SessionOrchestrator::onConnected() {
  Lock lock(mutex_);
  if (state_.phase != SessionPhase::Connecting || !protocol_) {
    LOG_WARN("SessionOrchestrator: onConnected в состоянии %s проигнорирован", toString(state_.phase));
    return;
  }
  cancelTimer(connect_timer_);
  setPhase(SessionPhase::Authenticating);
  if (config_.session.authTimeoutMs > 0) {
    auth_timer_ = scheduler_.schedule(clock_() + config_.session.authTimeoutMs, "auth-timeout", [this]() {
      auth_timer_ = 0;
      if (state_.phase != SessionPhase::Authenticating) return;
      LOG_WARN("SessionOrchestrator: тайм-аут аутентификации");
      failAttempt(ErrorKind::AuthenticationFailure, "authentication timeout", true);
    });
  }
  protocol_->startAuthentication();
}

void SessionOrchestrator::onDisconnected(const std::string& reason) {
  Lock lock(mutex_);
  switch (state_.phase) {
    case SessionPhase::Connected:
    case SessionPhase::Authenticating:
      LOG_WARN("SessionOrchestrator: неожиданный разрыв (%s)", reason.c_str());
      failAttempt(ErrorKind::TransportFailure, reason.empty() ? "disconnected" : reason, false);
      break;
    case SessionPhase::Connecting:
      LOG_WARN("SessionOrchestrator: соединение не установлено (%s)", reason.c_str());
      failAttempt(ErrorKind::TransportFailure, reason.empty() ? "connection failed" : reason, false);
      break;
    default:
      DEBUG_LOG("SessionOrchestrator: разрыв в состоянии %s", toString(state_.phase));
      break;
  }
}

void SessionOrchestrator::onBytesReceived(const std::vector<uint8_t>& data) {
  Lock lock(mutex_);
  if (!protocol_ ||
      (state_.phase != SessionPhase::Authenticating && state_.phase != SessionPhase::Connected)) {
    DEBUG_LOG("SessionOrchestrator: %u байт вне сессии отброшены", static_cast<unsigned>(data.size()));
    return;
  }
  protocol_->handleBytes(data);
}

void SessionOrchestrator::onError(TransportError code, const std::string& message) {
  Lock lock(mutex_);
  LOG_ERROR("SessionOrchestrator: ошибка транспорта %s: %s", toString(code), message.c_str());
  switch (state_.phase) {
    case SessionPhase::Scanning:
      cancelTimer(scan_timer_);
      transport_.stopScan();
      setPhase(SessionPhase::Error, ErrorKind::TransportFailure, toString(code));
      break;
    case SessionPhase::Connecting:
    case SessionPhase::Authenticating:
    case SessionPhase::Connected:
      failAttempt(ErrorKind::TransportFailure, toString(code), true);
      break;
    default:
      break;
  }
}

// ---------------------------------------------------------------------------
// События протокола

void SessionOrchestrator::onAuthenticationComplete(bool success) {
  if (state_.phase != SessionPhase::Authenticating) {
    LOG_WARN("SessionOrchestrator: результат аутентификации в состоянии %s проигнорирован",
             toString(state_.phase));
    return;
  }
  cancelTimer(auth_timer_);
  if (!success) {
    failAttempt(ErrorKind::AuthenticationFailure, "authentication failed", true);
    return;
  }
  failed_attempts_ = 0;
  last_connection_ms_ = clock_();
  setPhase(SessionPhase::Connected);
  // Наблюдатель мог отключить сессию из обработчика
  if (state_.phase != SessionPhase::Connected) return;
  store_.storeConnection(device_id_, last_connection_ms_);
  protocol_->requestGlucoseData();
  schedulePoll();
}

void SessionOrchestrator::onError(const std::string& message) {
  LOG_WARN("SessionOrchestrator: ошибка протокола: %s", message.c_str());
}

void SessionOrchestrator::sendBytes(const std::vector<uint8_t>& data) {
  if (!transport_.send(data)) {
    LOG_ERROR("SessionOrchestrator: запись %u байт не принята транспортом",
              static_cast<unsigned>(data.size()));
    if (state_.phase == SessionPhase::Authenticating || state_.phase == SessionPhase::Connected) {
      failAttempt(ErrorKind::TransportFailure, "write failed", true);
    }
  }
}

void SessionOrchestrator::onGlucoseData(const std::vector<GlucoseReading>& readings) {
  if (readings.empty()) return;
  const int64_t now = clock_();
  last_connection_ms_ = now;

  std::vector<GlucoseReading> batch = readings;
  std::stable_sort(batch.begin(), batch.end(), [](const GlucoseReading& a, const GlucoseReading& b) {
    return a.timestampMs < b.timestampMs;
  });
  for (const auto& reading : batch) {
    window_.insert(reading);
  }
  window_.prune(now);

  // Тренд каждой точки по окну, заканчивающемуся на ней
  std::vector<GlucoseReading> accepted;
  accepted.reserve(batch.size());
  for (auto& reading : batch) {
    reading.trend = ReadingClassifier::classifyTrend(window_.prefixUntil(reading.timestampMs));
    if (reading.quality != GlucoseQuality::Unreliable) {
      accepted.push_back(reading);
    }
  }
  if (!accepted.empty()) {
    store_.storeReadings(accepted, generation_);
  }
  const size_t dropped = batch.size() - accepted.size();
  if (dropped > 0) {
    LOG_WARN("SessionOrchestrator: %u ненадёжных показаний не сохранено", static_cast<unsigned>(dropped));
  }

  current_ = batch.back();
  LOG_INFO("SessionOrchestrator: глюкоза %.1f мг/дл, тренд %s, качество %s",
           current_->glucoseMgDl, toString(current_->trend), toString(current_->quality));
  store_.storeConnection(device_id_, last_connection_ms_);
  if (observer_) observer_->onCurrentReading(*current_);
}

void SessionOrchestrator::onSensorInfo(const SensorInfo& info) {
  const bool isNew = !sensor_info_ || sensor_info_->serialNumber.empty() ||
                     sensor_info_->serialNumber != info.serialNumber;
  SensorInfo merged = info;
  if (!merged.patchInfo && !isNew && sensor_info_ && sensor_info_->patchInfo) {
    merged.patchInfo = sensor_info_->patchInfo;   // ключевой материал прежнего сенсора
  }
  sensor_info_ = merged;
  const SensorState sensorState = deriveSensorState(sensor_info_, clock_());
  if (isNew) {
    LOG_INFO("SessionOrchestrator: новый сенсор %s", merged.serialNumber.c_str());
    if (config_.session.sensorChangeEvents) {
      store_.recordSensorChange(merged);
      if (observer_) observer_->onSensorChanged(merged);
    }
  }
  store_.storeSensorInfo(merged);
  StatusLog::logStatus("SENSOR " + merged.serialNumber + " " + toString(sensorState));
  if (observer_) observer_->onSensorInfo(merged, sensorState);
}

// ---------------------------------------------------------------------------
// Доступ к состоянию

SessionState SessionOrchestrator::state() const {
  Lock lock(mutex_);
  return state_;
}

ConnectionState SessionOrchestrator::connectionState() const {
  Lock lock(mutex_);
  return toConnectionState(state_.phase);
}

uint32_t SessionOrchestrator::failedAttempts() const {
  Lock lock(mutex_);
  return failed_attempts_;
}

std::vector<GlucoseReading> SessionOrchestrator::window() const {
  Lock lock(mutex_);
  return window_.readings();
}

std::optional<GlucoseReading> SessionOrchestrator::currentReading() const {
  Lock lock(mutex_);
  return current_;
}

std::optional<SensorInfo> SessionOrchestrator::sensorInfo() const {
  Lock lock(mutex_);
  return sensor_info_;
}

SensorState SessionOrchestrator::sensorState() const {
  Lock lock(mutex_);
  return deriveSensorState(sensor_info_, clock_());
}

int64_t SessionOrchestrator::lastConnectionTimeMs() const {
  Lock lock(mutex_);
  return last_connection_ms_;
}

std::string SessionOrchestrator::deviceId() const {
  Lock lock(mutex_);
  return device_id_;
}

Generation SessionOrchestrator::generation() const {
  Lock lock(mutex_);
  return generation_;
}

size_t SessionOrchestrator::pendingTimers() const {
  Lock lock(mutex_);
  return scheduler_.pending();
}

std::optional<ProtocolState> SessionOrchestrator::protocolState() const {
  Lock lock(mutex_);
  if (!protocol_) return std::nullopt;
  return protocol_->state();
}
