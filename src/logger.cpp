#include "logger.h"
// Реализация логгера с кольцевым буфером и доставкой строк в LogHook

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <mutex>

#include "libs/log_hook/log_hook.h"

namespace {

// Настройки очереди логов
constexpr size_t kQueueDepth = 128;                 // количество записей в кольцевом буфере
constexpr size_t kMaxPayload = 240;                 // максимальная длина сообщения

struct RecordStorage {
  DefaultSettings::LogLevel level = DefaultSettings::LogLevel::INFO; // уровень
  uint32_t timestamp_us = 0;                           // отметка времени
  uint16_t length = 0;                                 // фактическая длина строки
  bool truncated = false;                              // сообщение обрезано
  std::array<char, kMaxPayload + 1> payload{};         // текст + нуль-терминатор
};

Logger::Stats stats;                         // счётчики потерь

struct RingBuffer {
  std::array<RecordStorage, kQueueDepth> data{}; // хранилище записей
  size_t head = 0;                               // индекс первой записи
  size_t tail = 0;                               // индекс следующего свободного слота
  size_t size = 0;                               // количество элементов

  void push(const RecordStorage& rec) {
    if (size == data.size()) {
      // При переполнении удаляем самую старую запись
      head = (head + 1) % data.size();
      --size;
      ++stats.dropped_records;
    }
    data[tail] = rec;
    tail = (tail + 1) % data.size();
    ++size;
  }

  bool pop(RecordStorage& out) {
    if (size == 0) return false;
    out = data[head];
    head = (head + 1) % data.size();
    --size;
    return true;
  }
};

RingBuffer g_ring;                           // глобальный буфер
std::mutex g_mutex;                          // мьютекс для потокобезопасности

RecordStorage buildRecord(DefaultSettings::LogLevel level, const std::string& line) {
  RecordStorage rec;
  rec.level = level;
  rec.timestamp_us = Logger::nowMicros();
  rec.length = static_cast<uint16_t>(std::min(line.size(), kMaxPayload));
  rec.truncated = line.size() > kMaxPayload;
  std::memcpy(rec.payload.data(), line.data(), rec.length);
  rec.payload[rec.length] = '\0';
  return rec;
}

std::string renderRecord(const RecordStorage& rec) {
  std::string text(rec.payload.data(), rec.length);
  if (rec.truncated) {
    text.append(" …");
  }
  return text;
}

bool pushRecord(DefaultSettings::LogLevel level, const std::string& line) {
  RecordStorage rec = buildRecord(level, line);
  {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (rec.truncated) {
      stats.truncated_records++;
      stats.truncated_bytes += static_cast<uint32_t>(line.size() - kMaxPayload);
    }
    g_ring.push(rec);
  }
  // Доставка в LogHook выполняется вне блокировки: подписчик может сам писать в журнал
  std::string rendered = renderRecord(rec);
  rendered.insert(0, std::string("[") + Logger::levelTag(level) + "] ");
  LogHook::append(rendered);
  return true;
}

bool shouldAccept(DefaultSettings::LogLevel level) {
  if (!DefaultSettings::DEBUG) return false;
  return level <= DefaultSettings::LOG_LEVEL;
}

std::string formatVa(const char* fmt, va_list args) {
  va_list copy;
  va_copy(copy, args);
  int required = std::vsnprintf(nullptr, 0, fmt, copy);
  va_end(copy);
  if (required <= 0) {
    return std::string();
  }
  std::vector<char> buffer(static_cast<size_t>(required) + 1);
  std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
  return std::string(buffer.data(), static_cast<size_t>(required));
}

} // namespace

namespace Logger {

void init() {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_ring = RingBuffer{};
  stats = Stats{};
}

bool enqueue(DefaultSettings::LogLevel level, const std::string& line) {
  if (!shouldAccept(level)) return false;
  return pushRecord(level, line);
}

bool enqueuef(DefaultSettings::LogLevel level, const char* fmt, ...) {
  if (!shouldAccept(level)) return false;
  va_list args;
  va_start(args, fmt);
  std::string line = formatVa(fmt, args);
  va_end(args);
  return pushRecord(level, line);
}

Stats consumeStats() {
  std::lock_guard<std::mutex> lock(g_mutex);
  Stats snapshot = stats;
  stats = Stats{};
  return snapshot;
}

std::vector<Record> drain() {
  std::vector<Record> out;
  std::lock_guard<std::mutex> lock(g_mutex);
  out.reserve(g_ring.size);
  RecordStorage rec;
  while (g_ring.pop(rec)) {
    Record item;
    item.level = rec.level;
    item.timestamp_us = rec.timestamp_us;
    item.text = renderRecord(rec);
    out.push_back(std::move(item));
  }
  return out;
}

size_t pending() {
  std::lock_guard<std::mutex> lock(g_mutex);
  return g_ring.size;
}

size_t queueCapacity() {
  return kQueueDepth;
}

size_t payloadLimit() {
  return kMaxPayload;
}

uint32_t nowMicros() {
  using clock = std::chrono::steady_clock;
  static const auto start = clock::now();
  auto delta = clock::now() - start;
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(delta).count();
  return static_cast<uint32_t>(us);
}

const char* levelTag(DefaultSettings::LogLevel level) {
  switch (level) {
    case DefaultSettings::LogLevel::ERROR: return "E";
    case DefaultSettings::LogLevel::WARN:  return "W";
    case DefaultSettings::LogLevel::INFO:  return "I";
    case DefaultSettings::LogLevel::DEBUG: return "D";
  }
  return "?";
}

} // namespace Logger
