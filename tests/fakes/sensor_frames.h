#pragma once
// Построение ответов сенсора для тестов: блоки Gen2 и записи Gen3 с шифрованием mbedTLS
#include <array>
#include <cassert>
#include <cstdint>
#include <vector>

#include <mbedtls/aes.h>

#include "../../src/libs/cgm_crypto/cgm_crypto.h"

namespace SensorFrames {

constexpr size_t GEN2_BLOCK_SIZE = 344;
constexpr size_t GEN2_TREND_OFFSET = 28;
constexpr size_t GEN2_HISTORY_OFFSET = 124;

inline std::vector<uint8_t> patchInfo() {
  std::vector<uint8_t> patch(24);
  for (size_t i = 0; i < patch.size(); ++i) patch[i] = static_cast<uint8_t>(0x10 + i);
  return patch;
}

// Пустой блок ответа Gen2 с индексами тренда и истории
inline std::vector<uint8_t> gen2Block(uint8_t trendIndex = 0, uint8_t historyIndex = 0) {
  std::vector<uint8_t> block(GEN2_BLOCK_SIZE, 0);
  block[0] = 0x02;
  block[26] = trendIndex;
  block[27] = historyIndex;
  return block;
}

inline void putGen2Record(std::vector<uint8_t>& block, size_t offset,
                          uint16_t raw, uint16_t flags, uint16_t temp = 0) {
  block[offset] = static_cast<uint8_t>(raw & 0xFF);
  block[offset + 1] = static_cast<uint8_t>(raw >> 8);
  block[offset + 2] = static_cast<uint8_t>(flags & 0xFF);
  block[offset + 3] = static_cast<uint8_t>(flags >> 8);
  block[offset + 4] = static_cast<uint8_t>(temp & 0xFF);
  block[offset + 5] = static_cast<uint8_t>(temp >> 8);
}

// Запись тренда, снятая minutesAgo минут назад при trendIndex = 0
inline void putGen2Trend(std::vector<uint8_t>& block, size_t minutesAgo, uint16_t raw, uint16_t flags = 0) {
  const size_t index = (16 - minutesAgo % 16) % 16;
  putGen2Record(block, GEN2_TREND_OFFSET + index * 6, raw, flags);
}

// Шифрование всего, кроме 8-байтового заголовка, ключом из patchInfo
inline std::vector<uint8_t> encryptGen2(const std::vector<uint8_t>& plain, const std::vector<uint8_t>& patch) {
  std::array<uint8_t, 16> key = CgmCrypto::deriveGen2Key(patch);
  std::array<uint8_t, 16> iv = CgmCrypto::deriveGen2Iv(patch);
  const size_t len = plain.size() - CgmCrypto::GEN2_HEADER_SIZE;
  assert(len % CgmCrypto::BLOCK_SIZE == 0);
  std::vector<uint8_t> out(plain);
  mbedtls_aes_context ctx;
  mbedtls_aes_init(&ctx);
  assert(mbedtls_aes_setkey_enc(&ctx, key.data(), 128) == 0);
  assert(mbedtls_aes_crypt_cbc(&ctx, MBEDTLS_AES_ENCRYPT, len, iv.data(),
                               plain.data() + CgmCrypto::GEN2_HEADER_SIZE,
                               out.data() + CgmCrypto::GEN2_HEADER_SIZE) == 0);
  mbedtls_aes_free(&ctx);
  return out;
}

inline void putGen3Record(std::vector<uint8_t>& out, uint16_t raw, uint16_t flags, uint32_t seconds) {
  out.push_back(static_cast<uint8_t>(raw & 0xFF));
  out.push_back(static_cast<uint8_t>(raw >> 8));
  out.push_back(static_cast<uint8_t>(flags & 0xFF));
  out.push_back(static_cast<uint8_t>(flags >> 8));
  for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>((seconds >> (8 * i)) & 0xFF));
}

// Счётчик (16 байт) + записи, зашифрованные AES-CTR сеансовым ключом
inline std::vector<uint8_t> encryptGen3(const std::vector<uint8_t>& records, const std::vector<uint8_t>& key) {
  std::array<uint8_t, 16> counter{};
  for (size_t i = 0; i < counter.size(); ++i) counter[i] = static_cast<uint8_t>(0xF0 ^ i);
  std::vector<uint8_t> out(counter.begin(), counter.end());
  mbedtls_aes_context ctx;
  mbedtls_aes_init(&ctx);
  assert(mbedtls_aes_setkey_enc(&ctx, key.data(), 128) == 0);
  std::array<uint8_t, 16> stream{};
  size_t off = 0;
  std::vector<uint8_t> cipher(records.size());
  assert(mbedtls_aes_crypt_ctr(&ctx, records.size(), &off, counter.data(), stream.data(),
                               records.data(), cipher.data()) == 0);
  mbedtls_aes_free(&ctx);
  out.insert(out.end(), cipher.begin(), cipher.end());
  return out;
}

} // namespace SensorFrames
