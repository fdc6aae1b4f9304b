#include "protocol_engine.h"

#include <chrono>

#include "default_settings.h"
#include "gen2_protocol.h"
#include "gen3_protocol.h"

ProtocolEngine::ProtocolEngine(Clock clock)
    : clock_(clock ? std::move(clock) : Clock(systemNowMs)) {}

void ProtocolEngine::setState(ProtocolState next) {
  if (state_ == next) return;
  DEBUG_LOG("%s: %s -> %s", toString(generation()), toString(state_), toString(next));
  state_ = next;
}

void ProtocolEngine::emitGlucose(const std::vector<GlucoseReading>& readings) {
  if (listener_) listener_->onGlucoseData(readings);
}

void ProtocolEngine::emitSensorInfo(const SensorInfo& info) {
  if (listener_) listener_->onSensorInfo(info);
}

void ProtocolEngine::emitAuthentication(bool success) {
  if (listener_) listener_->onAuthenticationComplete(success);
}

void ProtocolEngine::emitError(const std::string& message) {
  if (listener_) listener_->onError(message);
}

void ProtocolEngine::emitSend(const std::vector<uint8_t>& data) {
  if (listener_) listener_->sendBytes(data);
}

int64_t systemNowMs() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::unique_ptr<ProtocolEngine> makeProtocolEngine(Generation generation,
                                                   ProtocolEngine::Clock clock,
                                                   const std::vector<uint8_t>& deviceInfo,
                                                   RandomSource::Fill random) {
  if (generation == Generation::Gen3) {
    return std::make_unique<Gen3Protocol>(std::move(clock), deviceInfo, std::move(random));
  }
  return std::make_unique<Gen2Protocol>(std::move(clock));
}
