#include <cassert>
#include <cstdint>
#include <vector>

#include "../src/libs/frame_codec/frame_codec.h"

using FrameCodec::ExtractStatus;
using FrameCodec::MessageType;

int main() {
  // Короче заголовка: "неполно", ничего не поглощено
  {
    const std::vector<uint8_t> partial{0x10, 0x02, 0x00};
    for (size_t len = 0; len <= partial.size(); ++len) {
      FrameCodec::ProtocolMessage msg;
      size_t consumed = 99;
      assert(FrameCodec::tryExtractMessage(partial.data(), len, msg, consumed) == ExtractStatus::Incomplete);
      assert(consumed == 0);
    }
  }

  // Полезная нагрузка пришла не целиком
  {
    const std::vector<uint8_t> data{0x10, 0x03, 0x00, 0x07, 0xAA, 0xBB};
    FrameCodec::ProtocolMessage msg;
    size_t consumed = 0;
    assert(FrameCodec::tryExtractMessage(data.data(), data.size(), msg, consumed) == ExtractStatus::Incomplete);
    assert(consumed == 0);
  }

  // Полное сообщение и остаток
  {
    const std::vector<uint8_t> data{0x20, 0x02, 0x00, 0x05, 0x01, 0x02, 0x30};
    FrameCodec::ProtocolMessage msg;
    size_t consumed = 0;
    assert(FrameCodec::tryExtractMessage(data.data(), data.size(), msg, consumed) == ExtractStatus::Complete);
    assert(consumed == 6);
    assert(msg.type == static_cast<uint8_t>(MessageType::SensorInfo));
    assert(msg.sequence == 0x05);
    assert((msg.payload == std::vector<uint8_t>{0x01, 0x02}));
  }

  // Кодирование: длина little-endian
  {
    std::vector<uint8_t> payload(0x0102, 0x55);
    auto encoded = FrameCodec::encodeMessage(0x30, 9, payload);
    assert(encoded.size() == FrameCodec::HEADER_SIZE + payload.size());
    assert(encoded[0] == 0x30);
    assert(encoded[1] == 0x02);
    assert(encoded[2] == 0x01);
    assert(encoded[3] == 9);
  }

  // Буфер приёма: фрагментация, неизвестный тип пропускается
  {
    FrameCodec::ReceiveBuffer buffer;
    FrameCodec::ProtocolMessage msg;
    auto first = FrameCodec::encodeMessage(0x01, 1, std::vector<uint8_t>(16, 0xA5));
    auto unknown = FrameCodec::encodeMessage(0x7F, 2, {0xDE, 0xAD});
    auto keepAlive = FrameCodec::encodeMessage(0x30, 3, {});
    std::vector<uint8_t> stream(first);
    stream.insert(stream.end(), unknown.begin(), unknown.end());
    stream.insert(stream.end(), keepAlive.begin(), keepAlive.end());

    // Подаём по одному байту
    std::vector<FrameCodec::ProtocolMessage> received;
    for (uint8_t byte : stream) {
      buffer.append(&byte, 1);
      while (buffer.nextMessage(msg)) received.push_back(msg);
    }
    assert(received.size() == 2);
    assert(received[0].type == 0x01 && received[0].payload.size() == 16);
    assert(received[1].type == 0x30 && received[1].payload.empty());
    assert(buffer.skipped() == 1);
    assert(buffer.size() == 0);

    // Незавершённое сообщение остаётся в буфере
    const std::vector<uint8_t> half{0x10, 0x08, 0x00, 0x04, 0x01};
    buffer.append(half);
    assert(!buffer.nextMessage(msg));
    assert(buffer.size() == half.size());
    buffer.clear();
    assert(buffer.size() == 0);
  }
  return 0;
}
