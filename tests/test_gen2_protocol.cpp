#include <cassert>
#include <cstdint>
#include <vector>

#include "../src/gen2_protocol.h"
#include "../src/libs/cgm_crypto/cgm_crypto.h"
#include "fakes/recording_listener.h"
#include "fakes/sensor_frames.h"

namespace {

constexpr int64_t kNow = 1700000000000LL;
constexpr int64_t kMinute = 60000;

using SensorFrames::patchInfo;

SensorInfo sensorWithPatch() {
  SensorInfo info;
  info.serialNumber = "3MH001ABCD";
  info.startTimeMs = kNow - 2 * 24 * 60 * kMinute;
  info.expiryTimeMs = info.startTimeMs + 14LL * 24 * 60 * kMinute;
  info.generation = Generation::Gen2;
  info.patchInfo = patchInfo();
  return info;
}

// Открытый блок ответа: тренд 0 -> 120, тренд 15 -> 118, история 0 -> 100
std::vector<uint8_t> plainGlucoseBlock() {
  std::vector<uint8_t> block = SensorFrames::gen2Block();
  SensorFrames::putGen2Record(block, SensorFrames::GEN2_TREND_OFFSET, 120, 0x0000, 3250);
  SensorFrames::putGen2Trend(block, 1, 118, 0x4000);
  SensorFrames::putGen2Record(block, SensorFrames::GEN2_HISTORY_OFFSET, 100, 0x0000);
  return block;
}

void testNoKey() {
  Gen2Protocol protocol([] { return kNow; });
  RecordingListener listener;
  protocol.setListener(&listener);
  protocol.initialize(std::nullopt);
  assert(!protocol.hasUnlockKey());
  protocol.startAuthentication();
  assert(protocol.state() == ProtocolState::Error);
  assert(listener.errors.size() == 1);
  assert(listener.errors[0].find("NFC") != std::string::npos);
  assert(listener.auth.size() == 1 && !listener.auth[0]);
  assert(listener.sent.empty());
}

void testUnlockAndPoll() {
  Gen2Protocol protocol([] { return kNow; });
  RecordingListener listener;
  protocol.setListener(&listener);
  protocol.initialize(sensorWithPatch());
  assert(protocol.hasUnlockKey());

  // Подтверждение до начала аутентификации игнорируется
  protocol.handleBytes({Gen2Protocol::RSP_UNLOCK_SUCCESS});
  assert(protocol.state() == ProtocolState::Idle);
  assert(listener.auth.empty());

  protocol.startAuthentication();
  assert(protocol.state() == ProtocolState::Authenticating);
  assert(listener.sent.size() == 1);
  std::vector<uint8_t> expected{Gen2Protocol::CMD_UNLOCK};
  auto key = CgmCrypto::deriveUnlockKey(patchInfo());
  expected.insert(expected.end(), key.begin(), key.end());
  assert(listener.sent[0] == expected);
  assert(listener.sent[0].size() == 12);

  // Запрос глюкозы до разблокировки не отправляется
  protocol.requestGlucoseData();
  assert(listener.sent.size() == 1);

  protocol.handleBytes({Gen2Protocol::RSP_UNLOCK_SUCCESS});
  assert(protocol.state() == ProtocolState::Authenticated);
  assert(listener.auth.size() == 1 && listener.auth[0]);
  assert(protocol.pendingBytes() == 0);

  protocol.requestGlucoseData();
  assert(protocol.state() == ProtocolState::Reading);
  assert(listener.sent.size() == 2);
  assert(listener.sent[1] == std::vector<uint8_t>{Gen2Protocol::CMD_GET_GLUCOSE});

  // Зашифрованный ответ приходит тремя фрагментами
  auto cipher = SensorFrames::encryptGen2(plainGlucoseBlock(), patchInfo());
  protocol.handleBytes(std::vector<uint8_t>(cipher.begin(), cipher.begin() + 100));
  assert(listener.glucose.empty());
  assert(protocol.pendingBytes() == 100);
  protocol.handleBytes(std::vector<uint8_t>(cipher.begin() + 100, cipher.begin() + 200));
  assert(listener.glucose.empty());
  protocol.handleBytes(std::vector<uint8_t>(cipher.begin() + 200, cipher.end()));
  assert(protocol.pendingBytes() == 0);
  assert(listener.glucose.size() == 1);

  const auto& readings = listener.glucose[0];
  assert(readings.size() == 3);
  assert(readings[0].timestampMs == kNow - 16 * kMinute);
  assert(readings[0].glucoseMgDl == 100.0);
  assert(readings[1].timestampMs == kNow - kMinute);
  assert(readings[1].glucoseMgDl == 118.0);
  assert(readings[1].quality == GlucoseQuality::Degraded);
  assert(readings[2].timestampMs == kNow);
  assert(readings[2].glucoseMgDl == 120.0);
  assert(readings[2].temperatureC && *readings[2].temperatureC == 32.5);

  // После ответа возможен следующий опрос
  assert(protocol.state() == ProtocolState::Authenticated);
  protocol.requestGlucoseData();
  assert(listener.sent.size() == 3);
}

void testUnknownResponse() {
  Gen2Protocol protocol([] { return kNow; });
  RecordingListener listener;
  protocol.setListener(&listener);
  protocol.initialize(sensorWithPatch());
  protocol.handleBytes({0x55, 0x01, 0x02, 0x03});
  assert(protocol.pendingBytes() == 0);
  assert(listener.glucose.empty());
  assert(listener.errors.empty());
}

void testGlucoseOutsideSession() {
  Gen2Protocol protocol([] { return kNow; });
  RecordingListener listener;
  protocol.setListener(&listener);
  protocol.initialize(sensorWithPatch());
  protocol.handleBytes(plainGlucoseBlock());
  assert(listener.glucose.empty());
  assert(protocol.pendingBytes() == 0);
  assert(protocol.state() == ProtocolState::Idle);
}

void testPatchInfoResponse() {
  Gen2Protocol protocol([] { return kNow; });
  RecordingListener listener;
  protocol.setListener(&listener);
  protocol.initialize(std::nullopt);

  std::vector<uint8_t> response(24, 0);
  response[0] = Gen2Protocol::RSP_PATCH_INFO;
  response[1] = 0xA2;
  response[2] = 0x08;
  const char serial[] = "0M00ABCDEF";
  for (size_t i = 0; i < 10; ++i) response[3 + i] = static_cast<uint8_t>(serial[i]);
  response[13] = 0xD0;                   // 2000 минут работы
  response[14] = 0x07;
  for (size_t i = 15; i < response.size(); ++i) response[i] = static_cast<uint8_t>(i);

  // Неполный ответ ждёт продолжения
  protocol.handleBytes(std::vector<uint8_t>(response.begin(), response.begin() + 10));
  assert(listener.infos.empty());
  protocol.handleBytes(std::vector<uint8_t>(response.begin() + 10, response.end()));
  assert(listener.infos.size() == 1);
  const SensorInfo& info = listener.infos[0];
  assert(info.serialNumber == "0M00ABCDEF");
  assert(info.generation == Generation::Gen2);
  assert(info.startTimeMs == kNow - 2000 * kMinute);
  assert(info.expiryTimeMs == info.startTimeMs + 14LL * 24 * 60 * kMinute);
  assert(info.patchInfo && *info.patchInfo == response);
  assert(protocol.hasUnlockKey());
  assert(protocol.sensorInfo() && protocol.sensorInfo()->serialNumber == "0M00ABCDEF");
}

void testReset() {
  Gen2Protocol protocol([] { return kNow; });
  RecordingListener listener;
  protocol.setListener(&listener);
  protocol.initialize(sensorWithPatch());
  protocol.startAuthentication();
  protocol.handleBytes({Gen2Protocol::RSP_GLUCOSE_DATA, 0x00, 0x01});
  assert(protocol.pendingBytes() == 3);
  protocol.reset();
  assert(protocol.state() == ProtocolState::Idle);
  assert(protocol.pendingBytes() == 0);
  assert(!protocol.hasUnlockKey());
  assert(!protocol.sensorInfo());
  assert(protocol.generation() == Generation::Gen2);
}

} // namespace

int main() {
  testNoKey();
  testUnlockAndPoll();
  testUnknownResponse();
  testGlucoseOutsideSession();
  testPatchInfoResponse();
  testReset();
  return 0;
}
