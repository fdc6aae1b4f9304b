#pragma once
// Разбиение потока Gen3 на сообщения: тип(1) + длина LE(2) + номер(1) + полезная нагрузка
#include <cstddef>
#include <cstdint>
#include <vector>

namespace FrameCodec {

constexpr size_t HEADER_SIZE = 4;   // тип + длина + номер

// Типы сообщений Gen3
enum class MessageType : uint8_t {
  AuthChallenge = 0x01,
  AuthResponse = 0x02,
  AuthSuccess = 0x03,
  GlucoseData = 0x10,
  SensorInfo = 0x20,
  KeepAlive = 0x30
};

// Проверка, известен ли тип сообщения
bool isKnownType(uint8_t type);

// Одно полное сообщение
struct ProtocolMessage {
  uint8_t type = 0;
  uint8_t sequence = 0;
  std::vector<uint8_t> payload;
};

// Результат попытки выделить сообщение
enum class ExtractStatus : uint8_t {
  Incomplete,  // данных не хватает, ничего не поглощено
  Complete,    // сообщение выделено
  Skipped      // неизвестный тип, байты поглощены и отброшены
};

// Пытается выделить сообщение из начала data. consumed: число поглощённых байтов
ExtractStatus tryExtractMessage(const uint8_t* data, size_t len,
                                ProtocolMessage& out, size_t& consumed);

// Сборка исходящего сообщения
std::vector<uint8_t> encodeMessage(uint8_t type, uint8_t sequence,
                                   const std::vector<uint8_t>& payload);

// Накопительный буфер приёма со смещением прочитанной части
class ReceiveBuffer {
 public:
  // Добавление очередной порции байтов от транспорта
  void append(const uint8_t* data, size_t len);
  void append(const std::vector<uint8_t>& data) { append(data.data(), data.size()); }

  // Следующее полное сообщение известного типа; неизвестные пропускаются
  bool nextMessage(ProtocolMessage& out);

  // Непрочитанные байты
  size_t size() const { return storage_.size() - offset_; }
  const uint8_t* data() const { return storage_.data() + offset_; }

  // Отбросить n непрочитанных байтов
  void consume(size_t n);

  // Полная очистка
  void clear();

  // Количество отброшенных сообщений неизвестного типа
  uint32_t skipped() const { return skipped_; }

 private:
  void compact();

  std::vector<uint8_t> storage_;   // сырые байты
  size_t offset_ = 0;              // начало непрочитанной части
  uint32_t skipped_ = 0;
};

} // namespace FrameCodec
