#include "status_log.h"
#include <array>
#include <mutex>
#include <string_view>
#include "libs/log_hook/log_hook.h"          // публикация в общий журнал

namespace {
// Максимальный размер кольцевого буфера
constexpr size_t MAX_STATUS_RECORDS = 64;

// Запись журнала с сохранённым префиксом
struct StatusEntry {
  std::string prefix;   // префикс до первого пробела
  std::string line;     // полная строка статуса
};

std::array<StatusEntry, MAX_STATUS_RECORDS> g_log{}; // кольцевой буфер записей
size_t g_head = 0;                                   // индекс старейшей записи
size_t g_size = 0;                                   // текущее количество строк
std::mutex g_mutex;

// Поиск записи по префиксу для замены
StatusEntry* findByPrefix(std::string_view prefix) {
  for (size_t i = 0; i < g_size; ++i) {
    size_t idx = (g_head + i) % g_log.size();
    if (g_log[idx].prefix == prefix) {
      return &g_log[idx];
    }
  }
  return nullptr;
}
} // namespace

namespace StatusLog {
void logStatus(const std::string& line) {
  auto pos = line.find(' ');
  std::string_view prefix_view = (pos == std::string::npos)
                                   ? std::string_view(line)
                                   : std::string_view(line.data(), pos);
  {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (StatusEntry* existing = findByPrefix(prefix_view)) {
      existing->line = line;                     // обновляем строку на месте
    } else {
      size_t index;
      if (g_size < g_log.size()) {
        index = (g_head + g_size) % g_log.size();  // используем свободный слот
        ++g_size;
      } else {
        index = g_head;                            // перезаписываем самую старую запись
        g_head = (g_head + 1) % g_log.size();
      }
      StatusEntry& entry = g_log[index];
      entry.prefix.assign(prefix_view.data(), prefix_view.size());
      entry.line = line;
    }
  }
  LogHook::append(line);                           // дублируем в общий журнал
}

std::vector<std::string> getLast(size_t count) {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (count > g_size) count = g_size;
  std::vector<std::string> out;
  out.reserve(count);
  size_t start = g_size - count;
  for (size_t i = start; i < g_size; ++i) {
    size_t idx = (g_head + i) % g_log.size();
    out.push_back(g_log[idx].line);
  }
  return out;
}

std::string find(const std::string& prefix) {
  std::lock_guard<std::mutex> lock(g_mutex);
  const StatusEntry* entry = findByPrefix(prefix);
  return entry ? entry->line : std::string();
}

void clear() {
  std::lock_guard<std::mutex> lock(g_mutex);
  for (auto& entry : g_log) {
    entry = StatusEntry{};
  }
  g_head = 0;
  g_size = 0;
}
} // namespace StatusLog
