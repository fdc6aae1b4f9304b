#include "gen3_protocol.h"

#include "default_settings.h"
#include "libs/cgm_crypto/cgm_crypto.h"
#include "libs/glucose_decoder/glucose_decoder.h"

using FrameCodec::MessageType;

Gen3Protocol::Gen3Protocol(Clock clock, std::vector<uint8_t> deviceInfo, RandomSource::Fill random)
    : ProtocolEngine(std::move(clock)),
      device_info_(std::move(deviceInfo)),
      random_(random ? std::move(random) : RandomSource::secure()) {
  if (device_info_.size() != DEVICE_INFO_SIZE) {
    LOG_WARN("Gen3Protocol: deviceInfo %u байт, ожидается %u",
             static_cast<unsigned>(device_info_.size()), static_cast<unsigned>(DEVICE_INFO_SIZE));
    device_info_.resize(DEVICE_INFO_SIZE, 0);
  }
}

Gen3Protocol::~Gen3Protocol() {
  CgmCrypto::wipe(session_key_);
}

void Gen3Protocol::initialize(const std::optional<SensorInfo>& info) {
  sensor_info_ = info;
  buffer_.clear();
  CgmCrypto::wipe(session_key_);
  message_counter_ = 0;
  stream_requested_ = false;
  setState(ProtocolState::Idle);
  LOG_INFO("Gen3Protocol: инициализация%s%s", info ? " для сенсора " : "",
           info ? info->serialNumber.c_str() : "");
}

void Gen3Protocol::handleBytes(const std::vector<uint8_t>& data) {
  if (data.empty()) return;
  buffer_.append(data);
  FrameCodec::ProtocolMessage message;
  while (buffer_.nextMessage(message)) {
    dispatch(message);
  }
}

void Gen3Protocol::dispatch(const FrameCodec::ProtocolMessage& message) {
  DEBUG_LOG("Gen3Protocol: сообщение 0x%02X #%u, %u байт", static_cast<unsigned>(message.type),
            static_cast<unsigned>(message.sequence), static_cast<unsigned>(message.payload.size()));
  switch (static_cast<MessageType>(message.type)) {
    case MessageType::AuthChallenge:
      handleChallenge(message.payload);
      break;
    case MessageType::AuthSuccess:
      handleAuthSuccess();
      break;
    case MessageType::GlucoseData:
      handleGlucose(message.payload);
      break;
    case MessageType::SensorInfo:
      handleSensorInfo(message.payload);
      break;
    case MessageType::KeepAlive:
      handleKeepAlive();
      break;
    case MessageType::AuthResponse:
      LOG_WARN("Gen3Protocol: входящий AUTH_RESPONSE не ожидается, отброшен");
      break;
  }
}

void Gen3Protocol::handleChallenge(const std::vector<uint8_t>& payload) {
  if (state() != ProtocolState::Idle && state() != ProtocolState::Authenticating) {
    LOG_WARN("Gen3Protocol: запрос аутентификации в состоянии %s отброшен", toString(state()));
    return;
  }
  if (payload.size() < MIN_CHALLENGE) {
    LOG_ERROR("Gen3Protocol: запрос аутентификации слишком короткий (%u байт)",
              static_cast<unsigned>(payload.size()));
    setState(ProtocolState::Error);
    emitError("Invalid auth challenge");
    emitAuthentication(false);
    return;
  }
  setState(ProtocolState::Authenticating);
  std::vector<uint8_t> sensorRandom(payload.begin(), payload.begin() + RANDOM_SIZE);
  std::vector<uint8_t> deviceRandom = RandomSource::bytes(random_, RANDOM_SIZE);
  if (deviceRandom.empty()) {
    LOG_ERROR("Gen3Protocol: нет случайных байтов для ответа");
    setState(ProtocolState::Error);
    emitError("Random source unavailable");
    emitAuthentication(false);
    return;
  }
  CgmCrypto::wipe(session_key_);
  session_key_ = CgmCrypto::deriveGen3SessionKey(device_info_, sensorRandom);
  DEBUG_LOG("Gen3Protocol: сеансовый ключ получен, crc=0x%04X",
            static_cast<unsigned>(CgmCrypto::crc16(session_key_)));

  std::vector<uint8_t> response(device_info_);
  response.insert(response.end(), deviceRandom.begin(), deviceRandom.end());
  emitSend(createMessage(MessageType::AuthResponse, response));
}

void Gen3Protocol::handleAuthSuccess() {
  if (state() != ProtocolState::Authenticating || session_key_.empty()) {
    LOG_WARN("Gen3Protocol: AUTH_SUCCESS в состоянии %s отброшен", toString(state()));
    return;
  }
  LOG_INFO("Gen3Protocol: аутентификация выполнена");
  setState(ProtocolState::Authenticated);
  emitAuthentication(true);
  requestGlucoseData();
}

void Gen3Protocol::handleGlucose(const std::vector<uint8_t>& payload) {
  if (session_key_.empty()) {
    LOG_WARN("Gen3Protocol: данные глюкозы без сеансового ключа отброшены");
    return;
  }
  if (state() != ProtocolState::Authenticated && state() != ProtocolState::Reading) {
    LOG_WARN("Gen3Protocol: данные глюкозы в состоянии %s отброшены", toString(state()));
    return;
  }
  if (stream_requested_) {
    setState(ProtocolState::Reading);
  }
  std::vector<uint8_t> plain = CgmCrypto::decryptGen3(payload, session_key_);
  std::optional<int64_t> start;
  if (sensor_info_) start = sensor_info_->startTimeMs;
  std::vector<GlucoseReading> readings = GlucoseDecoder::decodeGen3Glucose(plain, start, now());
  if (readings.empty()) {
    return;  // пустой пакет не является ошибкой
  }
  emitGlucose(readings);
}

void Gen3Protocol::handleSensorInfo(const std::vector<uint8_t>& payload) {
  auto info = GlucoseDecoder::decodeGen3SensorInfo(payload, now());
  if (!info) {
    DEBUG_LOG("Gen3Protocol: сведения о сенсоре неполные (%u байт)",
              static_cast<unsigned>(payload.size()));
    return;
  }
  sensor_info_ = info;
  emitSensorInfo(*info);
}

void Gen3Protocol::handleKeepAlive() {
  emitSend(createMessage(MessageType::KeepAlive, {}));
}

void Gen3Protocol::startAuthentication() {
  // Аутентификацию начинает сенсор, ждём запрос
  setState(ProtocolState::Authenticating);
}

void Gen3Protocol::requestGlucoseData() {
  if (state() != ProtocolState::Authenticated) {
    LOG_WARN("Gen3Protocol: запрос глюкозы невозможен в состоянии %s", toString(state()));
    return;
  }
  // Данные идут потоком, отдельная команда не нужна
  stream_requested_ = true;
  DEBUG_LOG("Gen3Protocol: поток глюкозы активен");
}

void Gen3Protocol::reset() {
  buffer_.clear();
  CgmCrypto::wipe(session_key_);
  message_counter_ = 0;
  stream_requested_ = false;
  sensor_info_.reset();
  setState(ProtocolState::Idle);
}

std::vector<uint8_t> Gen3Protocol::createMessage(MessageType type, const std::vector<uint8_t>& payload) {
  ++message_counter_;
  return FrameCodec::encodeMessage(static_cast<uint8_t>(type), message_counter_, payload);
}
