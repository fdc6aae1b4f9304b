#pragma once
#ifndef LOG_HOOK_LOG_H
#define LOG_HOOK_LOG_H

// Единый хук журналирования с буферизацией сообщений и нотификацией подписчиков

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace LogHook {

  // Структура одной записи журнала
  struct Entry {
    uint32_t id;        // последовательный идентификатор строки
    std::string text;   // текст сообщения
    uint32_t uptime_ms; // время с момента старта процесса
  };

  using Dispatcher = std::function<void(const Entry&)>; // колбэк доставки новых сообщений

  // Установка обработчика, который будет вызван при появлении новых записей
  void setDispatcher(Dispatcher cb);

  // Добавление строки в буфер и запуск уведомления
  void append(const std::string& line);
  void append(const char* line);

  // Получение последних N записей (не более ёмкости буфера)
  std::vector<Entry> getRecent(size_t count);

  // Очистка буфера и сброс счётчика идентификаторов
  void clear();

  // Возвращает текущий размер буфера
  size_t size();

  // Ёмкость буфера
  size_t capacity();

} // namespace LogHook
#endif // LOG_HOOK_LOG_H
