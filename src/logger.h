#pragma once
// Подсистема журналирования с кольцевым буфером для хостовой сборки cgmbridge

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "default_settings.h"

namespace Logger {

// Статистика по потерям и обрезкам
struct Stats {
  uint32_t dropped_records = 0;      // количество потерянных записей при переполнении
  uint32_t truncated_records = 0;    // количество обрезанных сообщений
  uint32_t truncated_bytes = 0;      // количество усечённых байтов
};

// Одна запись в буфере, выдаётся через snapshot()
struct Record {
  DefaultSettings::LogLevel level = DefaultSettings::LogLevel::INFO; // уровень
  uint32_t timestamp_us = 0;                                         // отметка времени
  std::string text;                                                  // текст (уже с пометкой обрезки)
};

// Сброс буфера и счётчиков
void init();

// Добавление готовой строки в очередь
bool enqueue(DefaultSettings::LogLevel level, const std::string& line);

// Форматирование по printf-подобному шаблону и помещение в очередь
bool enqueuef(DefaultSettings::LogLevel level, const char* fmt, ...);

// Возвращает текущую статистику (копию) и обнуляет счётчики
Stats consumeStats();

// Изъятие накопленных записей (от старой к новой)
std::vector<Record> drain();

// Количество записей в буфере
size_t pending();

// Получение отметки времени (микросекунды с момента старта)
uint32_t nowMicros();

// Предоставление параметров буфера для тестов
size_t queueCapacity();
size_t payloadLimit();

// Текстовое имя уровня ("E", "W", "I", "D")
const char* levelTag(DefaultSettings::LogLevel level);

} // namespace Logger
