#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "cgm_types.h"

// Упорядоченное по времени окно последних показаний с ограниченной глубиной.
// Показание с уже имеющейся меткой времени заменяет прежнее.
class ReadingWindow {
 public:
  explicit ReadingWindow(int64_t retention_ms) : retention_ms_(retention_ms) {}

  void insert(const GlucoseReading& reading);

  // Удаление показаний старше now_ms - retention; возвращает число удалённых
  size_t prune(int64_t now_ms);

  // Показания с меткой не позже timestamp_ms (префикс окна)
  std::vector<GlucoseReading> prefixUntil(int64_t timestamp_ms) const;

  const std::vector<GlucoseReading>& readings() const { return readings_; }
  size_t size() const { return readings_.size(); }
  bool empty() const { return readings_.empty(); }
  int64_t retentionMs() const { return retention_ms_; }
  void clear() { readings_.clear(); }

 private:
  int64_t retention_ms_;
  std::vector<GlucoseReading> readings_;
};
