#pragma once
// Абстрактный дуплексный канал до сенсора (BLE реализуется снаружи)
#include <cstdint>
#include <string>
#include <vector>

#include "cgm_types.h"

// Коды ошибок транспорта
enum class TransportError : uint8_t {
  BluetoothDisabled,
  PermissionDenied,
  ScanFailed,
  ConnectionFailed,
  AuthenticationFailed,
  GattError,
  SensorNotFound,
  ProtocolError,
  Timeout
};

const char* toString(TransportError error);

// Уведомления транспорта; доставляются в одном последовательном контексте
class ITransportListener {
 public:
  virtual ~ITransportListener() = default;
  virtual void onDeviceFound(const std::string& deviceId, Generation generation) = 0;
  virtual void onConnected() = 0;
  virtual void onDisconnected(const std::string& reason) = 0;
  virtual void onBytesReceived(const std::vector<uint8_t>& data) = 0;
  virtual void onError(TransportError code, const std::string& message) = 0;
};

// Интерфейс транспорта, который потребляет SessionOrchestrator
class ICgmTransport {
 public:
  virtual ~ICgmTransport() = default;
  // Поиск устройства заданного поколения; результат через onDeviceFound
  virtual bool startScan(Generation generation) = 0;
  virtual void stopScan() = 0;
  virtual bool connect(const std::string& deviceId) = 0;
  virtual void disconnect() = 0;
  // Неблокирующая отправка; false: запись не принята
  virtual bool send(const std::vector<uint8_t>& data) = 0;
};
