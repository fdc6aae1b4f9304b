#include "cgm_types.h"

#include "default_settings.h"

const char* toString(Generation generation) {
  switch (generation) {
    case Generation::Gen2: return "gen2";
    case Generation::Gen3: return "gen3";
  }
  return "unknown";
}

const char* toString(TrendArrow trend) {
  switch (trend) {
    case TrendArrow::None:          return "NONE";
    case TrendArrow::DoubleUp:      return "DOUBLE_UP";
    case TrendArrow::SingleUp:      return "SINGLE_UP";
    case TrendArrow::FortyFiveUp:   return "FORTY_FIVE_UP";
    case TrendArrow::Flat:          return "FLAT";
    case TrendArrow::FortyFiveDown: return "FORTY_FIVE_DOWN";
    case TrendArrow::SingleDown:    return "SINGLE_DOWN";
    case TrendArrow::DoubleDown:    return "DOUBLE_DOWN";
  }
  return "NONE";
}

const char* toString(GlucoseQuality quality) {
  switch (quality) {
    case GlucoseQuality::Good:       return "GOOD";
    case GlucoseQuality::Degraded:   return "DEGRADED";
    case GlucoseQuality::Unreliable: return "UNRELIABLE";
  }
  return "UNRELIABLE";
}

const char* toString(ProtocolState state) {
  switch (state) {
    case ProtocolState::Idle:           return "IDLE";
    case ProtocolState::Authenticating: return "AUTHENTICATING";
    case ProtocolState::Authenticated:  return "AUTHENTICATED";
    case ProtocolState::Reading:        return "READING";
    case ProtocolState::Error:          return "ERROR";
  }
  return "ERROR";
}

const char* toString(SessionPhase phase) {
  switch (phase) {
    case SessionPhase::Idle:           return "IDLE";
    case SessionPhase::Scanning:       return "SCANNING";
    case SessionPhase::Connecting:     return "CONNECTING";
    case SessionPhase::Authenticating: return "AUTHENTICATING";
    case SessionPhase::Connected:      return "CONNECTED";
    case SessionPhase::Reconnecting:   return "RECONNECTING";
    case SessionPhase::Error:          return "ERROR";
  }
  return "ERROR";
}

const char* toString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:                  return "none";
    case ErrorKind::MalformedInput:        return "malformed-input";
    case ErrorKind::CryptoFailure:         return "crypto-failure";
    case ErrorKind::ProtocolViolation:     return "protocol-violation";
    case ErrorKind::TransportFailure:      return "transport-failure";
    case ErrorKind::AuthenticationFailure: return "authentication-failure";
    case ErrorKind::Timeout:               return "timeout";
    case ErrorKind::Exhausted:             return "exhausted";
  }
  return "none";
}

const char* toString(ConnectionState state) {
  switch (state) {
    case ConnectionState::Disconnected:   return "DISCONNECTED";
    case ConnectionState::Scanning:       return "SCANNING";
    case ConnectionState::Connecting:     return "CONNECTING";
    case ConnectionState::Authenticating: return "AUTHENTICATING";
    case ConnectionState::Connected:      return "CONNECTED";
    case ConnectionState::Reconnecting:   return "RECONNECTING";
  }
  return "DISCONNECTED";
}

const char* toString(SensorState state) {
  switch (state) {
    case SensorState::None:     return "NONE";
    case SensorState::Starting: return "STARTING";
    case SensorState::Ready:    return "READY";
    case SensorState::Ending:   return "ENDING";
    case SensorState::Expired:  return "EXPIRED";
  }
  return "NONE";
}

ConnectionState toConnectionState(SessionPhase phase) {
  switch (phase) {
    case SessionPhase::Scanning:       return ConnectionState::Scanning;
    case SessionPhase::Connecting:     return ConnectionState::Connecting;
    case SessionPhase::Authenticating: return ConnectionState::Authenticating;
    case SessionPhase::Connected:      return ConnectionState::Connected;
    case SessionPhase::Reconnecting:   return ConnectionState::Reconnecting;
    case SessionPhase::Idle:
    case SessionPhase::Error:
      break;
  }
  return ConnectionState::Disconnected;
}

SensorState deriveSensorState(const std::optional<SensorInfo>& info, int64_t now_ms) {
  if (!info) return SensorState::None;
  if (info->expiryTimeMs <= now_ms) return SensorState::Expired;
  if (info->expiryTimeMs - now_ms <= DefaultSettings::SENSOR_ENDING_MS) return SensorState::Ending;
  if (now_ms - info->startTimeMs < DefaultSettings::SENSOR_WARMUP_MS) return SensorState::Starting;
  return SensorState::Ready;
}
