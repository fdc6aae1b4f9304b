#include "reading_window.h"

#include <algorithm>

namespace {
bool earlier(const GlucoseReading& r, int64_t ts) { return r.timestampMs < ts; }
}

void ReadingWindow::insert(const GlucoseReading& reading) {
  auto it = std::lower_bound(readings_.begin(), readings_.end(), reading.timestampMs, earlier);
  if (it != readings_.end() && it->timestampMs == reading.timestampMs) {
    *it = reading;                      // повтор из пересекающихся окон
    return;
  }
  readings_.insert(it, reading);
}

size_t ReadingWindow::prune(int64_t now_ms) {
  const int64_t cutoff = now_ms - retention_ms_;
  auto it = std::lower_bound(readings_.begin(), readings_.end(), cutoff, earlier);
  const size_t removed = static_cast<size_t>(it - readings_.begin());
  readings_.erase(readings_.begin(), it);
  return removed;
}

std::vector<GlucoseReading> ReadingWindow::prefixUntil(int64_t timestamp_ms) const {
  auto it = std::upper_bound(readings_.begin(), readings_.end(), timestamp_ms,
                             [](int64_t ts, const GlucoseReading& r) { return ts < r.timestampMs; });
  return std::vector<GlucoseReading>(readings_.begin(), it);
}
