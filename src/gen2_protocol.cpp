#include "gen2_protocol.h"

#include "default_settings.h"
#include "libs/cgm_crypto/cgm_crypto.h"
#include "libs/glucose_decoder/glucose_decoder.h"

Gen2Protocol::Gen2Protocol(Clock clock) : ProtocolEngine(std::move(clock)) {}

Gen2Protocol::~Gen2Protocol() {
  CgmCrypto::wipe(unlock_key_);
}

void Gen2Protocol::initialize(const std::optional<SensorInfo>& info) {
  sensor_info_ = info;
  pending_.clear();
  setState(ProtocolState::Idle);
  deriveKeys();
  if (sensor_info_) {
    LOG_INFO("Gen2Protocol: инициализация для сенсора %s", sensor_info_->serialNumber.c_str());
  } else {
    LOG_INFO("Gen2Protocol: инициализация без сведений о сенсоре");
  }
}

void Gen2Protocol::deriveKeys() {
  CgmCrypto::wipe(unlock_key_);
  if (!sensor_info_ || !sensor_info_->patchInfo) {
    return;
  }
  unlock_key_ = CgmCrypto::deriveUnlockKey(*sensor_info_->patchInfo);
  if (!unlock_key_.empty()) {
    // В журнал попадает только отпечаток patchInfo
    DEBUG_LOG("Gen2Protocol: ключ разблокировки получен, patch crc=0x%04X",
              static_cast<unsigned>(CgmCrypto::crc16(*sensor_info_->patchInfo)));
  }
}

void Gen2Protocol::handleBytes(const std::vector<uint8_t>& data) {
  if (data.empty()) return;
  DEBUG_LOG("Gen2Protocol: получено %u байт", static_cast<unsigned>(data.size()));
  pending_.append(data);
  processPending();
}

void Gen2Protocol::processPending() {
  if (pending_.size() == 0) return;
  switch (pending_.data()[0]) {
    case RSP_UNLOCK_SUCCESS:
      handleUnlockResponse();
      pending_.clear();
      break;
    case RSP_PATCH_INFO:
      if (handlePatchInfoResponse()) pending_.clear();
      break;
    case RSP_GLUCOSE_DATA:
      if (handleGlucoseResponse()) pending_.clear();
      break;
    default:
      LOG_WARN("Gen2Protocol: неизвестный тип ответа 0x%02X, буфер очищен",
               static_cast<unsigned>(pending_.data()[0]));
      pending_.clear();
      break;
  }
}

void Gen2Protocol::handleUnlockResponse() {
  if (state() != ProtocolState::Authenticating) {
    LOG_WARN("Gen2Protocol: подтверждение разблокировки в состоянии %s отброшено",
             toString(state()));
    return;
  }
  LOG_INFO("Gen2Protocol: разблокировка выполнена");
  setState(ProtocolState::Authenticated);
  emitAuthentication(true);
}

bool Gen2Protocol::handlePatchInfoResponse() {
  if (pending_.size() < GlucoseDecoder::GEN2_MIN_SENSOR_INFO) {
    return false;  // ждём остаток
  }
  std::vector<uint8_t> block(pending_.data(), pending_.data() + pending_.size());
  auto info = GlucoseDecoder::decodeGen2SensorInfo(block, now());
  if (info) {
    LOG_INFO("Gen2Protocol: сведения о сенсоре %s", info->serialNumber.c_str());
    sensor_info_ = info;
    deriveKeys();
    emitSensorInfo(*info);
  }
  return true;
}

bool Gen2Protocol::handleGlucoseResponse() {
  if (pending_.size() < GlucoseDecoder::GEN2_MIN_GLUCOSE_BLOCK) {
    return false;
  }
  if (state() != ProtocolState::Authenticated && state() != ProtocolState::Reading) {
    LOG_WARN("Gen2Protocol: данные глюкозы в состоянии %s отброшены", toString(state()));
    return true;
  }
  std::vector<uint8_t> block(pending_.data(), pending_.data() + pending_.size());
  if (!unlock_key_.empty() && sensor_info_ && sensor_info_->patchInfo) {
    block = CgmCrypto::decryptGen2(block, *sensor_info_->patchInfo);
  }
  std::vector<GlucoseReading> readings = GlucoseDecoder::decodeGen2Glucose(block, now());
  // Ответ получен, следующий опрос допускается из Authenticated
  setState(ProtocolState::Authenticated);
  if (!readings.empty()) {
    emitGlucose(readings);
  } else {
    LOG_WARN("Gen2Protocol: в ответе нет допустимых показаний");
  }
  return true;
}

void Gen2Protocol::startAuthentication() {
  if (unlock_key_.empty()) {
    LOG_ERROR("Gen2Protocol: нет ключа разблокировки, требуется активация через NFC");
    setState(ProtocolState::Error);
    emitError("No unlock key available. Sensor may need NFC activation.");
    emitAuthentication(false);
    return;
  }
  setState(ProtocolState::Authenticating);
  std::vector<uint8_t> cmd;
  cmd.reserve(1 + unlock_key_.size());
  cmd.push_back(CMD_UNLOCK);
  cmd.insert(cmd.end(), unlock_key_.begin(), unlock_key_.end());
  DEBUG_LOG("Gen2Protocol: отправка команды разблокировки");
  emitSend(cmd);
}

void Gen2Protocol::requestGlucoseData() {
  if (state() != ProtocolState::Authenticated) {
    LOG_WARN("Gen2Protocol: запрос глюкозы невозможен в состоянии %s", toString(state()));
    return;
  }
  setState(ProtocolState::Reading);
  emitSend(std::vector<uint8_t>{CMD_GET_GLUCOSE});
}

void Gen2Protocol::reset() {
  pending_.clear();
  CgmCrypto::wipe(unlock_key_);
  sensor_info_.reset();
  setState(ProtocolState::Idle);
}
