#include "transport_interface.h"

const char* toString(TransportError error) {
  switch (error) {
    case TransportError::BluetoothDisabled:    return "bluetooth-disabled";
    case TransportError::PermissionDenied:     return "permission-denied";
    case TransportError::ScanFailed:           return "scan-failed";
    case TransportError::ConnectionFailed:     return "connection-failed";
    case TransportError::AuthenticationFailed: return "authentication-failed";
    case TransportError::GattError:            return "gatt-error";
    case TransportError::SensorNotFound:       return "sensor-not-found";
    case TransportError::ProtocolError:        return "protocol-error";
    case TransportError::Timeout:              return "timeout";
  }
  return "unknown";
}
