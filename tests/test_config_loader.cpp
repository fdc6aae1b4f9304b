#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>

#include "../src/default_settings.h"
#include "../src/libs/config_loader/config_loader.h"
#include "../src/libs/log_hook/log_hook.h"
#include "../src/logger.h"

namespace {

bool hookContains(const std::string& needle) {
  for (const auto& entry : LogHook::getRecent(LogHook::capacity())) {
    if (entry.text.find(needle) != std::string::npos) return true;
  }
  return false;
}

void testDefaults() {
  ConfigLoader::Config config = ConfigLoader::makeDefaults();
  assert(config.sensor.generation == Generation::Gen2);
  assert(config.sensor.deviceInfo[0] == 0x42);
  assert(config.sensor.deviceInfo[1] == 0x53);
  assert(config.sensor.deviceInfo[15] == 0x41);
  assert(config.session.retentionMs == 30u * 60u * 1000u);
  assert(config.session.reconnectAttempts == 10);
  assert(config.session.backoffBaseMs == 1000);
  assert(config.session.backoffMaxMs == 60000);
  assert(config.session.autoReconnect);
  assert(config.session.sensorChangeEvents);
}

void testParse() {
  const std::string text =
      "; комментарий\n"
      "[Sensor]\n"
      "generation = Gen3\n"
      "device_info = 00112233 44556677 8899AABB CCDDEEFF\n"
      "\n"
      "[session]\n"
      "retention_minutes = 45\n"
      "reconnect_attempts = 3\n"
      "backoff_base_ms = 500\n"
      "backoff_max_ms = 4000\n"
      "auth_timeout_ms = 0\n"
      "auto_reconnect = off\n"
      "sensor_change_events = no\n";
  ConfigLoader::Config config = ConfigLoader::parse(text);
  assert(config.sensor.generation == Generation::Gen3);
  assert(config.sensor.deviceInfo[0] == 0x00);
  assert(config.sensor.deviceInfo[5] == 0x55);
  assert(config.sensor.deviceInfo[15] == 0xFF);
  assert(config.session.retentionMs == 45u * 60u * 1000u);
  assert(config.session.reconnectAttempts == 3);
  assert(config.session.backoffBaseMs == 500);
  assert(config.session.backoffMaxMs == 4000);
  assert(config.session.authTimeoutMs == 0);
  assert(!config.session.autoReconnect);
  assert(!config.session.sensorChangeEvents);
  // не заданные ключи остаются по умолчанию
  assert(config.session.pollIntervalMs == DefaultSettings::POLL_INTERVAL_MS);
}

void testInvalidValues() {
  LogHook::clear();
  const std::string text =
      "[sensor]\n"
      "generation = gen9\n"
      "device_info = 0011\n"
      "colour = blue\n"
      "[session]\n"
      "reconnect_attempts = 0\n"
      "backoff_base_ms = -5\n"
      "retention_minutes = abc\n"
      "auto_reconnect = maybe\n"
      "строка без разделителя\n"
      "[radio]\n"
      "power = 10\n";
  ConfigLoader::Config config = ConfigLoader::parse(text);
  ConfigLoader::Config defaults = ConfigLoader::makeDefaults();
  assert(config.sensor.generation == defaults.sensor.generation);
  assert(config.sensor.deviceInfo == defaults.sensor.deviceInfo);
  assert(config.session.reconnectAttempts == defaults.session.reconnectAttempts);
  assert(config.session.backoffBaseMs == defaults.session.backoffBaseMs);
  assert(config.session.retentionMs == defaults.session.retentionMs);
  assert(config.session.autoReconnect == defaults.session.autoReconnect);
  assert(hookContains("generation=gen9"));
  assert(hookContains("неизвестный параметр colour"));
  assert(hookContains("неизвестная секция [radio]"));
}

void testZeroIntervals() {
  LogHook::clear();
  ConfigLoader::Config config = ConfigLoader::parse(
      "[session]\n"
      "backoff_base_ms = 0\n"
      "scan_timeout_ms = 0\n"
      "connect_timeout_ms = 0\n");
  assert(config.session.backoffBaseMs == DefaultSettings::BACKOFF_BASE_MS);
  assert(config.session.scanTimeoutMs == DefaultSettings::SCAN_TIMEOUT_MS);
  assert(config.session.connectTimeoutMs == DefaultSettings::CONNECT_TIMEOUT_MS);
  assert(hookContains("backoff_base_ms=0"));
  assert(hookContains("scan_timeout_ms=0"));
  assert(hookContains("connect_timeout_ms=0"));
}

void testBackoffClamp() {
  ConfigLoader::Config config = ConfigLoader::parse(
      "[session]\nbackoff_base_ms = 5000\nbackoff_max_ms = 2000\n");
  assert(config.session.backoffBaseMs == 5000);
  assert(config.session.backoffMaxMs == 5000);
}

void testFiles() {
  ConfigLoader::Config missing = ConfigLoader::loadFile("/nonexistent/cgmbridge.ini");
  assert(missing.session.reconnectAttempts == DefaultSettings::RECONNECT_ATTEMPTS);

  const std::string path = "test_config_loader.tmp.ini";
  {
    std::ofstream out(path);
    out << "[session]\npoll_interval_ms = 15000\n";
  }
  const ConfigLoader::Config& reloaded = ConfigLoader::reload(path);
  assert(reloaded.session.pollIntervalMs == 15000);
  assert(ConfigLoader::getConfig().session.pollIntervalMs == 15000);
  std::remove(path.c_str());
}

} // namespace

int main() {
  Logger::init();
  testDefaults();
  testParse();
  testInvalidValues();
  testZeroIntervals();
  testBackoffClamp();
  testFiles();
  return 0;
}
