#pragma once
// Поддельные транспорт, хранилище, наблюдатель и виртуальные часы для тестов оркестратора
#include <cstdint>
#include <map>
#include <optional>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "../../src/collaborators.h"
#include "../../src/transport_interface.h"

// Транспорт без побочных эффектов: только учёт вызовов
struct FakeTransport : ICgmTransport {
  bool scanResult = true;
  bool connectResult = true;
  bool sendResult = true;

  std::vector<Generation> scans;
  int stopScans = 0;
  std::vector<std::string> connects;
  int disconnects = 0;
  std::vector<std::vector<uint8_t>> sent;

  bool startScan(Generation generation) override {
    scans.push_back(generation);
    return scanResult;
  }
  void stopScan() override { ++stopScans; }
  bool connect(const std::string& deviceId) override {
    connects.push_back(deviceId);
    return connectResult;
  }
  void disconnect() override { ++disconnects; }
  bool send(const std::vector<uint8_t>& data) override {
    sent.push_back(data);
    return sendResult;
  }
};

// Хранилище в памяти; повторная вставка по (timestamp, source) заменяет запись
struct FakeStore : IReadingStore {
  std::optional<SensorInfo> stored;
  std::map<std::pair<int64_t, int>, GlucoseReading> readings;
  int storeReadingsCalls = 0;
  std::vector<SensorInfo> sensorUpdates;
  std::vector<SensorInfo> sensorChanges;
  std::string lastDevice;
  int64_t lastConnectionMs = 0;

  void storeReadings(const std::vector<GlucoseReading>& batch, Generation source) override {
    ++storeReadingsCalls;
    for (const auto& r : batch) {
      readings[std::make_pair(r.timestampMs, static_cast<int>(source))] = r;
    }
  }
  void storeSensorInfo(const SensorInfo& info) override {
    sensorUpdates.push_back(info);
    stored = info;
  }
  void recordSensorChange(const SensorInfo& info) override { sensorChanges.push_back(info); }
  void storeConnection(const std::string& deviceId, int64_t ms) override {
    lastDevice = deviceId;
    lastConnectionMs = ms;
  }
  std::optional<SensorInfo> loadSensorInfo() override { return stored; }

  const GlucoseReading* find(int64_t timestampMs, Generation source) const {
    auto it = readings.find(std::make_pair(timestampMs, static_cast<int>(source)));
    return it == readings.end() ? nullptr : &it->second;
  }
};

struct FakeObserver : ISessionObserver {
  std::vector<SessionState> states;
  std::vector<GlucoseReading> current;
  std::vector<std::pair<SensorInfo, SensorState>> infos;
  std::vector<SensorInfo> changes;
  std::function<void(const SessionState&)> stateHook;

  void onSessionStateChanged(const SessionState& state) override {
    states.push_back(state);
    if (stateHook) stateHook(state);
  }
  void onCurrentReading(const GlucoseReading& reading) override { current.push_back(reading); }
  void onSensorInfo(const SensorInfo& info, SensorState state) override { infos.emplace_back(info, state); }
  void onSensorChanged(const SensorInfo& info) override { changes.push_back(info); }
};

// Виртуальные часы
struct VirtualClock {
  int64_t now = 1700000000000LL;
  void advance(int64_t ms) { now += ms; }
};
