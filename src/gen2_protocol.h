#pragma once
// Протокол сенсоров второго поколения: разблокировка ключом из patchInfo,
// опрос глюкозы командой и расшифровка ответа AES-CBC
#include <cstdint>
#include <vector>

#include "protocol_engine.h"
#include "libs/frame_codec/frame_codec.h"

class Gen2Protocol : public ProtocolEngine {
 public:
  // Команды
  static constexpr uint8_t CMD_GET_GLUCOSE = 0x02;
  static constexpr uint8_t CMD_UNLOCK = 0x07;
  // Ответы
  static constexpr uint8_t RSP_PATCH_INFO = 0x01;
  static constexpr uint8_t RSP_GLUCOSE_DATA = 0x02;
  static constexpr uint8_t RSP_UNLOCK_SUCCESS = 0x08;

  explicit Gen2Protocol(Clock clock = Clock());
  ~Gen2Protocol() override;

  Generation generation() const override { return Generation::Gen2; }
  void initialize(const std::optional<SensorInfo>& info) override;
  void handleBytes(const std::vector<uint8_t>& data) override;
  void startAuthentication() override;
  void requestGlucoseData() override;
  void reset() override;

  bool hasUnlockKey() const { return !unlock_key_.empty(); }
  size_t pendingBytes() const { return pending_.size(); }

 private:
  void processPending();
  void handleUnlockResponse();
  bool handlePatchInfoResponse();
  bool handleGlucoseResponse();
  void deriveKeys();

  FrameCodec::ReceiveBuffer pending_;   // фрагменты ответа
  std::vector<uint8_t> unlock_key_;     // 11 байт или пусто
};
