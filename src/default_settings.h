#ifndef DEFAULT_SETTINGS_H
#define DEFAULT_SETTINGS_H // защита от повторного включения

#include <array>
#include <cstddef>
#include <cstdint>
#include <sstream>  // для формирования строк логов
#include <string>

// Значения параметров сессии CGM по умолчанию
namespace DefaultSettings {
  constexpr bool USE_GEN3 = false;                    // Поколение сенсора по умолчанию (false: Gen2)
  constexpr uint32_t RETENTION_MS = 30UL * 60UL * 1000UL;      // Глубина окна показаний (30 мин)
  constexpr uint8_t RECONNECT_ATTEMPTS = 10;          // Предел попыток переподключения
  constexpr uint32_t BACKOFF_BASE_MS = 1000;          // Базовая задержка переподключения (мс)
  constexpr uint32_t BACKOFF_MAX_MS = 60000;          // Верхняя граница задержки (мс)
  constexpr uint32_t SCAN_TIMEOUT_MS = 30000;         // Тайм-аут поиска сенсора (мс)
  constexpr uint32_t CONNECT_TIMEOUT_MS = 30000;      // Тайм-аут установления соединения (мс)
  constexpr uint32_t AUTH_TIMEOUT_MS = 30000;         // Тайм-аут аутентификации (мс)
  constexpr uint32_t POLL_INTERVAL_MS = 60000;        // Период опроса Gen2 (сенсор пишет раз в минуту)
  constexpr uint32_t CLEANUP_INTERVAL_MS = 60UL * 60UL * 1000UL; // Период очистки окна (1 ч)
  constexpr bool AUTO_RECONNECT = true;               // Автоматическое переподключение
  constexpr bool SENSOR_CHANGE_EVENTS = true;         // Формировать события смены сенсора
  constexpr int64_t SENSOR_LIFESPAN_MS = 14LL * 24 * 60 * 60 * 1000; // Срок службы сенсора (14 суток)
  constexpr int64_t SENSOR_WARMUP_MS = 60LL * 60 * 1000;             // Прогрев сенсора (1 ч)
  constexpr int64_t SENSOR_ENDING_MS = 60LL * 60 * 1000;             // Порог «скоро истекает» (1 ч)
  constexpr bool DEBUG = true;                        // Флаг отладочного вывода
  // Уровни журналирования для фильтрации сообщений
  enum class LogLevel : uint8_t { ERROR = 0, WARN = 1, INFO = 2, DEBUG = 3 };
  constexpr LogLevel LOG_LEVEL = LogLevel::DEBUG;     // Текущий уровень вывода

  // Идентификатор устройства для Gen3 (16 байт), шаблон (i*17 + 0x42)
  constexpr std::array<uint8_t, 16> DEVICE_INFO{
      0x42, 0x53, 0x64, 0x75,
      0x86, 0x97, 0xA8, 0xB9,
      0xCA, 0xDB, 0xEC, 0xFD,
      0x0E, 0x1F, 0x30, 0x41};
}

#if !defined(LOG_MSG)
namespace Logger {
  bool enqueue(DefaultSettings::LogLevel level, const std::string& line);
  bool enqueuef(DefaultSettings::LogLevel level, const char* fmt, ...);
}

namespace LogDetail {
  inline bool logMsg(DefaultSettings::LogLevel level, const char* msg) {
    return Logger::enqueue(level, std::string(msg));
  }

  template <typename T>
  inline bool logMsgVal(DefaultSettings::LogLevel level, const char* prefix, const T& val) {
    std::ostringstream oss;
    oss << prefix << val;
    return Logger::enqueue(level, oss.str());
  }
} // namespace LogDetail

#  define LOG_MSG(level, msg) LogDetail::logMsg(level, msg)
#  define LOG_MSG_VAL(level, prefix, val) LogDetail::logMsgVal(level, prefix, val)
#  define LOG_MSG_FMT(level, ...) Logger::enqueuef(level, __VA_ARGS__)
#  define LOG_ERROR(...) LOG_MSG_FMT(DefaultSettings::LogLevel::ERROR, __VA_ARGS__)
#  define LOG_WARN(...)  LOG_MSG_FMT(DefaultSettings::LogLevel::WARN,  __VA_ARGS__)
#  define LOG_INFO(...)  LOG_MSG_FMT(DefaultSettings::LogLevel::INFO,  __VA_ARGS__)
#  define DEBUG_LOG(...) LOG_MSG_FMT(DefaultSettings::LogLevel::DEBUG, __VA_ARGS__)
#  define LOG_ERROR_VAL(prefix, val) LOG_MSG_VAL(DefaultSettings::LogLevel::ERROR, prefix, val)
#  define LOG_WARN_VAL(prefix, val)  LOG_MSG_VAL(DefaultSettings::LogLevel::WARN,  prefix, val)
#  define LOG_INFO_VAL(prefix, val)  LOG_MSG_VAL(DefaultSettings::LogLevel::INFO,  prefix, val)
#  define DEBUG_LOG_VAL(prefix, val) LOG_MSG_VAL(DefaultSettings::LogLevel::DEBUG, prefix, val)
#endif // !defined(LOG_MSG)

#endif // DEFAULT_SETTINGS_H
