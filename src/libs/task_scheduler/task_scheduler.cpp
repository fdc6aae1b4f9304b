#include "task_scheduler.h"

#include <algorithm>
#include <vector>

#include "default_settings.h"

TaskScheduler::TaskId TaskScheduler::schedule(int64_t due_ms, const char* name, Task task) {
  TaskId id = next_id_++;
  if (next_id_ == 0) next_id_ = 1;              // ноль не используется
  Entry entry;
  entry.due_ms = due_ms;
  entry.name = name ? name : "";
  entry.task = std::move(task);
  tasks_[id] = std::move(entry);
  DEBUG_LOG("TaskScheduler: задача %s #%u на %lld мс", name ? name : "-",
            static_cast<unsigned>(id), static_cast<long long>(due_ms));
  return id;
}

bool TaskScheduler::cancel(TaskId id) {
  return tasks_.erase(id) != 0;
}

void TaskScheduler::cancelAll() {
  tasks_.clear();
}

size_t TaskScheduler::poll(int64_t now_ms) {
  std::vector<std::pair<int64_t, TaskId>> due;
  for (const auto& item : tasks_) {
    if (item.second.due_ms <= now_ms) {
      due.emplace_back(item.second.due_ms, item.first);
    }
  }
  std::sort(due.begin(), due.end());
  size_t executed = 0;
  for (const auto& item : due) {
    auto it = tasks_.find(item.second);
    if (it == tasks_.end()) {
      continue;                                   // отменена предыдущей задачей
    }
    Task task = std::move(it->second.task);
    tasks_.erase(it);
    if (task) {
      task();
      ++executed;
    }
  }
  return executed;
}

std::optional<int64_t> TaskScheduler::nextDue() const {
  std::optional<int64_t> best;
  for (const auto& item : tasks_) {
    if (!best || item.second.due_ms < *best) best = item.second.due_ms;
  }
  return best;
}
