#pragma once
// Протокол сенсоров третьего поколения: аутентификация по запросу сенсора,
// сеансовый ключ и поток сообщений с расшифровкой AES-CTR
#include <cstdint>
#include <vector>

#include "protocol_engine.h"
#include "libs/frame_codec/frame_codec.h"
#include "libs/random_source/random_source.h"

class Gen3Protocol : public ProtocolEngine {
 public:
  static constexpr size_t DEVICE_INFO_SIZE = 16;
  static constexpr size_t RANDOM_SIZE = 8;
  static constexpr size_t MIN_CHALLENGE = 16;

  Gen3Protocol(Clock clock, std::vector<uint8_t> deviceInfo, RandomSource::Fill random);
  ~Gen3Protocol() override;

  Generation generation() const override { return Generation::Gen3; }
  void initialize(const std::optional<SensorInfo>& info) override;
  void handleBytes(const std::vector<uint8_t>& data) override;
  void startAuthentication() override;
  void requestGlucoseData() override;
  void reset() override;

  bool hasSessionKey() const { return !session_key_.empty(); }
  bool streamRequested() const { return stream_requested_; }
  uint8_t messageCounter() const { return message_counter_; }
  size_t pendingBytes() const { return buffer_.size(); }

 private:
  void dispatch(const FrameCodec::ProtocolMessage& message);
  void handleChallenge(const std::vector<uint8_t>& payload);
  void handleAuthSuccess();
  void handleGlucose(const std::vector<uint8_t>& payload);
  void handleSensorInfo(const std::vector<uint8_t>& payload);
  void handleKeepAlive();
  std::vector<uint8_t> createMessage(FrameCodec::MessageType type, const std::vector<uint8_t>& payload);

  std::vector<uint8_t> device_info_;     // идентификатор устройства (16 байт)
  RandomSource::Fill random_;            // источник случайных байтов
  FrameCodec::ReceiveBuffer buffer_;     // накопление фрагментов
  std::vector<uint8_t> session_key_;     // сеансовый ключ
  uint8_t message_counter_ = 0;          // номер исходящего сообщения
  bool stream_requested_ = false;        // поток глюкозы запрошен
};
