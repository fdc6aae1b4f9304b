#include "config_loader.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "default_settings.h"        // значения по умолчанию и макросы логирования

namespace ConfigLoader {
namespace {

// Утилита обрезки пробелов с краёв строки
std::string trim(const std::string& value) {
  auto begin = value.begin();
  while (begin != value.end() && std::isspace(static_cast<unsigned char>(*begin))) {
    ++begin;
  }
  auto end = value.end();
  while (end != begin && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
    --end;
  }
  return std::string(begin, end);
}

// Преобразование строки к нижнему регистру для унификации сравнения
std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return value;
}

// Разбор целого беззнакового значения с контролем диапазона
bool parseUint(const std::string& text, unsigned long maxValue, unsigned long& outValue) {
  if (text.empty() || text.front() == '-') {
    return false;
  }
  errno = 0;
  char* end = nullptr;
  unsigned long value = std::strtoul(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || (end && *end != '\0') || value > maxValue) {
    return false;
  }
  outValue = value;
  return true;
}

// Разбор логического значения
bool parseBool(const std::string& text, bool& outValue) {
  const std::string lower = toLower(text);
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
    outValue = true;
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
    outValue = false;
    return true;
  }
  return false;
}

// Преобразование строки с шестнадцатеричным идентификатором в массив байт
bool parseHex16(const std::string& text, std::array<uint8_t, 16>& out) {
  std::string sanitized;
  sanitized.reserve(text.size());
  for (char ch : text) {
    if (!std::isspace(static_cast<unsigned char>(ch))) {
      sanitized.push_back(ch);
    }
  }
  if (sanitized.size() != out.size() * 2) {
    return false;
  }
  std::array<uint8_t, 16> parsed{};
  for (size_t i = 0; i < parsed.size(); ++i) {
    char hi = sanitized[i * 2];
    char lo = sanitized[i * 2 + 1];
    if (!std::isxdigit(static_cast<unsigned char>(hi)) || !std::isxdigit(static_cast<unsigned char>(lo))) {
      return false;
    }
    unsigned long value = std::strtoul(sanitized.substr(i * 2, 2).c_str(), nullptr, 16);
    parsed[i] = static_cast<uint8_t>(value & 0xFFU);
  }
  out = parsed;
  return true;
}

// Преобразование строки в поколение сенсора
bool parseGeneration(const std::string& text, Generation& out) {
  const std::string lower = toLower(text);
  if (lower == "gen2" || lower == "2" || lower == "libre2") {
    out = Generation::Gen2;
    return true;
  }
  if (lower == "gen3" || lower == "3" || lower == "libre3") {
    out = Generation::Gen3;
    return true;
  }
  return false;
}

// Числовой параметр в миллисекундах
void applyMs(uint32_t& target, const std::string& key, const std::string& value, unsigned long maxValue) {
  unsigned long parsed = 0;
  if (parseUint(value, maxValue, parsed)) {
    target = static_cast<uint32_t>(parsed);
  } else {
    LOG_WARN("Config: некорректный %s=%s", key.c_str(), value.c_str());
  }
}

// Интервал, для которого 0 недопустим
void applyPositiveMs(uint32_t& target, const std::string& key, const std::string& value, unsigned long maxValue) {
  unsigned long parsed = 0;
  if (parseUint(value, maxValue, parsed) && parsed > 0) {
    target = static_cast<uint32_t>(parsed);
  } else {
    LOG_WARN("Config: некорректный %s=%s", key.c_str(), value.c_str());
  }
}

void applyFlag(bool& target, const std::string& key, const std::string& value) {
  bool parsed = false;
  if (parseBool(value, parsed)) {
    target = parsed;
  } else {
    LOG_WARN("Config: некорректный %s=%s", key.c_str(), value.c_str());
  }
}

// Разбор строки внутри конкретной секции
void applySetting(Config& config, const std::string& section, const std::string& key, const std::string& value) {
  if (section == "sensor") {
    if (key == "generation") {
      if (!parseGeneration(value, config.sensor.generation)) {
        LOG_WARN("Config: некорректное значение generation=%s", value.c_str());
      }
    } else if (key == "device_info") {
      if (!parseHex16(value, config.sensor.deviceInfo)) {
        LOG_WARN("Config: некорректный формат device_info");
      }
    } else {
      LOG_WARN("Config: неизвестный параметр %s в секции [sensor]", key.c_str());
    }
    return;
  }
  if (section == "session") {
    SessionConfig& s = config.session;
    if (key == "retention_minutes") {
      unsigned long parsed = 0;
      if (parseUint(value, 24UL * 60UL, parsed) && parsed > 0) {
        s.retentionMs = static_cast<uint32_t>(parsed * 60UL * 1000UL);
      } else {
        LOG_WARN("Config: некорректный retention_minutes=%s", value.c_str());
      }
    } else if (key == "reconnect_attempts") {
      unsigned long parsed = 0;
      if (parseUint(value, 255UL, parsed) && parsed > 0) {
        s.reconnectAttempts = static_cast<uint8_t>(parsed);
      } else {
        LOG_WARN("Config: некорректный reconnect_attempts=%s", value.c_str());
      }
    } else if (key == "backoff_base_ms") {
      applyPositiveMs(s.backoffBaseMs, key, value, 600000UL);
    } else if (key == "backoff_max_ms") {
      applyMs(s.backoffMaxMs, key, value, 3600000UL);
    } else if (key == "scan_timeout_ms") {
      applyPositiveMs(s.scanTimeoutMs, key, value, 600000UL);
    } else if (key == "connect_timeout_ms") {
      applyPositiveMs(s.connectTimeoutMs, key, value, 600000UL);
    } else if (key == "auth_timeout_ms") {
      applyMs(s.authTimeoutMs, key, value, 600000UL);
    } else if (key == "poll_interval_ms") {
      applyMs(s.pollIntervalMs, key, value, 3600000UL);
    } else if (key == "cleanup_interval_ms") {
      applyMs(s.cleanupIntervalMs, key, value, 86400000UL);
    } else if (key == "auto_reconnect") {
      applyFlag(s.autoReconnect, key, value);
    } else if (key == "sensor_change_events") {
      applyFlag(s.sensorChangeEvents, key, value);
    } else {
      LOG_WARN("Config: неизвестный параметр %s в секции [session]", key.c_str());
    }
    return;
  }
  LOG_WARN("Config: неизвестная секция [%s]", section.c_str());
}

} // namespace

Config makeDefaults() {
  Config config;
  config.sensor.generation = DefaultSettings::USE_GEN3 ? Generation::Gen3 : Generation::Gen2;
  config.sensor.deviceInfo = DefaultSettings::DEVICE_INFO;

  config.session.retentionMs = DefaultSettings::RETENTION_MS;
  config.session.reconnectAttempts = DefaultSettings::RECONNECT_ATTEMPTS;
  config.session.backoffBaseMs = DefaultSettings::BACKOFF_BASE_MS;
  config.session.backoffMaxMs = DefaultSettings::BACKOFF_MAX_MS;
  config.session.scanTimeoutMs = DefaultSettings::SCAN_TIMEOUT_MS;
  config.session.connectTimeoutMs = DefaultSettings::CONNECT_TIMEOUT_MS;
  config.session.authTimeoutMs = DefaultSettings::AUTH_TIMEOUT_MS;
  config.session.pollIntervalMs = DefaultSettings::POLL_INTERVAL_MS;
  config.session.cleanupIntervalMs = DefaultSettings::CLEANUP_INTERVAL_MS;
  config.session.autoReconnect = DefaultSettings::AUTO_RECONNECT;
  config.session.sensorChangeEvents = DefaultSettings::SENSOR_CHANGE_EVENTS;
  return config;
}

Config parse(const std::string& text) {
  Config config = makeDefaults();
  std::istringstream input(text);
  std::string line;
  std::string section;
  while (std::getline(input, line)) {
    std::string trimmed = trim(line);
    if (trimmed.empty()) {
      continue; // пропускаем пустые строки
    }
    if (trimmed.front() == ';' || trimmed.front() == '#') {
      continue; // комментарий в стиле ini
    }
    if (trimmed.front() == '[' && trimmed.back() == ']') {
      section = toLower(trim(trimmed.substr(1, trimmed.size() - 2)));
      continue;
    }
    auto eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
      LOG_WARN("Config: строка без разделителя '=' пропущена: %s", trimmed.c_str());
      continue;
    }
    std::string key = toLower(trim(trimmed.substr(0, eqPos)));
    std::string value = trim(trimmed.substr(eqPos + 1));
    if (key.empty()) {
      LOG_WARN("Config: обнаружен пустой ключ в секции [%s]", section.c_str());
      continue;
    }
    applySetting(config, section, key, value);
  }
  if (config.session.backoffMaxMs < config.session.backoffBaseMs) {
    LOG_WARN("Config: backoff_max_ms меньше backoff_base_ms, используется базовое значение");
    config.session.backoffMaxMs = config.session.backoffBaseMs;
  }
  return config;
}

Config loadFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.good()) {
    LOG_WARN("Config: файл %s не найден, используются значения по умолчанию", path.c_str());
    return makeDefaults();
  }
  std::ostringstream content;
  content << file.rdbuf();
  return parse(content.str());
}

namespace {
// Загрузка при первом обращении, после инициализации логгера
Config& storage() {
  static Config config = loadFile(kDefaultPath);
  return config;
}
} // namespace

const Config& getConfig() {
  return storage();
}

const Config& reload(const std::string& path) {
  storage() = loadFile(path);
  return storage();
}

} // namespace ConfigLoader
