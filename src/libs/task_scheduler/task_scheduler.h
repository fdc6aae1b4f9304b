#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

// Планировщик однократных отложенных задач с отменой. Время передаётся
// снаружи через poll(now_ms), поэтому в тестах используется виртуальное время.
class TaskScheduler {
 public:
  using TaskId = uint32_t;
  using Task = std::function<void()>;

  // Запланировать задачу на момент due_ms. name используется в журнале.
  TaskId schedule(int64_t due_ms, const char* name, Task task);

  // Отмена задачи; false если задача уже выполнена или не найдена.
  bool cancel(TaskId id);

  // Отмена всех задач.
  void cancelAll();

  // Выполнить все задачи со сроком не позже now_ms. Задачи, добавленные во
  // время выполнения, ждут следующего вызова. Возвращает число выполненных.
  size_t poll(int64_t now_ms);

  // Есть ли задача с указанным идентификатором.
  bool isPending(TaskId id) const { return tasks_.count(id) != 0; }

  // Количество ожидающих задач.
  size_t pending() const { return tasks_.size(); }

  // Ближайший срок среди ожидающих задач.
  std::optional<int64_t> nextDue() const;

 private:
  struct Entry {
    int64_t due_ms = 0;
    std::string name;
    Task task;
  };

  std::map<TaskId, Entry> tasks_;
  TaskId next_id_ = 1;
};
