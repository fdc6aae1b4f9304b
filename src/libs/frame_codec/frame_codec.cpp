#include "frame_codec.h"

#include "default_settings.h"

namespace FrameCodec {

bool isKnownType(uint8_t type) {
  switch (static_cast<MessageType>(type)) {
    case MessageType::AuthChallenge:
    case MessageType::AuthResponse:
    case MessageType::AuthSuccess:
    case MessageType::GlucoseData:
    case MessageType::SensorInfo:
    case MessageType::KeepAlive:
      return true;
  }
  return false;
}

ExtractStatus tryExtractMessage(const uint8_t* data, size_t len,
                                ProtocolMessage& out, size_t& consumed) {
  consumed = 0;
  if (!data || len < HEADER_SIZE) {
    return ExtractStatus::Incomplete;
  }
  const size_t payloadLen = static_cast<size_t>(data[1]) |
                            (static_cast<size_t>(data[2]) << 8);
  const size_t total = HEADER_SIZE + payloadLen;
  if (len < total) {
    return ExtractStatus::Incomplete;
  }
  consumed = total;
  if (!isKnownType(data[0])) {
    LOG_WARN("FrameCodec: неизвестный тип сообщения 0x%02X (%u байт) отброшен",
             static_cast<unsigned>(data[0]), static_cast<unsigned>(payloadLen));
    return ExtractStatus::Skipped;
  }
  out.type = data[0];
  out.sequence = data[3];
  out.payload.assign(data + HEADER_SIZE, data + total);
  return ExtractStatus::Complete;
}

std::vector<uint8_t> encodeMessage(uint8_t type, uint8_t sequence,
                                   const std::vector<uint8_t>& payload) {
  std::vector<uint8_t> out;
  out.reserve(HEADER_SIZE + payload.size());
  out.push_back(type);
  out.push_back(static_cast<uint8_t>(payload.size() & 0xFF));
  out.push_back(static_cast<uint8_t>((payload.size() >> 8) & 0xFF));
  out.push_back(sequence);
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

void ReceiveBuffer::append(const uint8_t* data, size_t len) {
  if (!data || len == 0) return;
  compact();
  storage_.insert(storage_.end(), data, data + len);
}

bool ReceiveBuffer::nextMessage(ProtocolMessage& out) {
  while (size() > 0) {
    size_t consumed = 0;
    ExtractStatus status = tryExtractMessage(data(), size(), out, consumed);
    if (status == ExtractStatus::Incomplete) {
      return false;
    }
    consume(consumed);
    if (status == ExtractStatus::Complete) {
      return true;
    }
    ++skipped_;                        // неизвестный тип, продолжаем со следующего
  }
  return false;
}

void ReceiveBuffer::consume(size_t n) {
  offset_ += (n < size()) ? n : size();
  if (offset_ == storage_.size()) {
    storage_.clear();
    offset_ = 0;
  }
}

void ReceiveBuffer::clear() {
  storage_.clear();
  offset_ = 0;
}

void ReceiveBuffer::compact() {
  // Сдвигаем данные, когда прочитанная часть занимает больше половины
  if (offset_ > 0 && offset_ * 2 >= storage_.size()) {
    storage_.erase(storage_.begin(), storage_.begin() + static_cast<std::ptrdiff_t>(offset_));
    offset_ = 0;
  }
}

} // namespace FrameCodec
