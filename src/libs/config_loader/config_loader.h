#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H // защита от повторного включения

#include <array>
#include <cstdint>
#include <string>

#include "cgm_types.h"             // поколение сенсора

namespace ConfigLoader {

// Параметры сенсора
struct SensorConfig {
  Generation generation;               // поколение протокола
  std::array<uint8_t, 16> deviceInfo;  // идентификатор устройства для Gen3
};

// Параметры сессии и переподключения
struct SessionConfig {
  uint32_t retentionMs;        // глубина окна показаний
  uint8_t reconnectAttempts;   // предел попыток переподключения
  uint32_t backoffBaseMs;      // базовая задержка
  uint32_t backoffMaxMs;       // максимальная задержка
  uint32_t scanTimeoutMs;      // тайм-аут поиска
  uint32_t connectTimeoutMs;   // тайм-аут соединения
  uint32_t authTimeoutMs;      // тайм-аут аутентификации (0: без ограничения)
  uint32_t pollIntervalMs;     // период опроса Gen2
  uint32_t cleanupIntervalMs;  // период очистки окна
  bool autoReconnect;          // автоматическое переподключение
  bool sensorChangeEvents;     // события смены сенсора
};

// Совокупность всех загружаемых настроек
struct Config {
  SensorConfig sensor;    // параметры сенсора
  SessionConfig session;  // параметры сессии
};

// Путь к конфигурационному файлу по умолчанию
constexpr const char* kDefaultPath = "config/cgmbridge.ini";

// Конфигурация из значений DefaultSettings
Config makeDefaults();

// Разбор текста INI поверх значений по умолчанию
Config parse(const std::string& text);

// Чтение файла; при отсутствии файла: значения по умолчанию
Config loadFile(const std::string& path);

// Возвращает загруженную конфигурацию (с подстановкой значений по умолчанию).
const Config& getConfig();

// Принудительно перечитывает конфигурацию с диска, возвращает актуальное состояние.
const Config& reload(const std::string& path = kDefaultPath);

} // namespace ConfigLoader

#endif // CONFIG_LOADER_H
