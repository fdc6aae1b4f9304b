#include "random_source.h"

#include <sodium.h>

#include "default_settings.h"

namespace RandomSource {

bool ensureInit() {
  static bool initialized = false;
  if (initialized) return true;
  if (sodium_init() == -1) {
    LOG_ERROR("RandomSource: sodium_init завершился ошибкой");
    return false;
  }
  initialized = true;
  return true;
}

Fill secure() {
  return [](uint8_t* out, size_t len) {
    if (!ensureInit()) return false;
    randombytes_buf(out, len);
    return true;
  };
}

std::vector<uint8_t> bytes(const Fill& fill, size_t len) {
  std::vector<uint8_t> out(len);
  if (!fill || !fill(out.data(), out.size())) {
    return {};
  }
  return out;
}

} // namespace RandomSource
