#include "log_hook.h"

#include <chrono>
#include <deque>
#include <mutex>

namespace {
  // Максимальная ёмкость буфера журналирования
  constexpr size_t kMaxEntries = 200;

  std::deque<LogHook::Entry> gBuffer;        // последние строки журнала
  LogHook::Dispatcher gDispatcher;           // обработчик push-уведомлений
  std::mutex gMutex;                         // защита общей памяти
  uint32_t gNextId = 1;                      // последовательный идентификатор записей
  const auto gStart = std::chrono::steady_clock::now(); // отметка старта процесса

  uint32_t uptimeMs() {
    using namespace std::chrono;
    auto diff = duration_cast<milliseconds>(steady_clock::now() - gStart);
    return static_cast<uint32_t>(diff.count());
  }

  // Добавление строки в буфер с учётом ограничений по размеру
  void pushEntry(const std::string& text) {
    LogHook::Entry entry{};
    LogHook::Dispatcher dispatcherCopy;
    {
      std::lock_guard<std::mutex> lock(gMutex);
      entry.id = gNextId++;
      entry.text = text;
      entry.uptime_ms = uptimeMs();
      gBuffer.push_back(entry);
      while (gBuffer.size() > kMaxEntries) {
        gBuffer.pop_front();
      }
      dispatcherCopy = gDispatcher;
    }
    if (dispatcherCopy) {
      dispatcherCopy(entry); // уведомляем подписчика вне блокировки
    }
  }
} // namespace

namespace LogHook {

void setDispatcher(Dispatcher cb) {
  std::lock_guard<std::mutex> lock(gMutex);
  gDispatcher = std::move(cb);
}

void append(const std::string& line) {
  pushEntry(line);
}

void append(const char* line) {
  pushEntry(line ? std::string(line) : std::string());
}

std::vector<Entry> getRecent(size_t count) {
  std::vector<Entry> out;
  std::lock_guard<std::mutex> lock(gMutex);
  if (count == 0 || gBuffer.empty()) {
    return out;
  }
  if (count > gBuffer.size()) {
    count = gBuffer.size();
  }
  out.reserve(count);
  const size_t start = gBuffer.size() - count;
  for (size_t i = start; i < gBuffer.size(); ++i) {
    out.push_back(gBuffer[i]);
  }
  return out;
}

void clear() {
  std::lock_guard<std::mutex> lock(gMutex);
  gBuffer.clear();
  gNextId = 1;
}

size_t size() {
  std::lock_guard<std::mutex> lock(gMutex);
  return gBuffer.size();
}

size_t capacity() {
  return kMaxEntries;
}

} // namespace LogHook
