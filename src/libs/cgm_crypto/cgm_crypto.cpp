#include "cgm_crypto.h"

#include <algorithm>

#include <mbedtls/aes.h>
#include <sodium.h>

#include "default_settings.h"

namespace CgmCrypto {

const std::array<uint8_t, 16> KEY_DERIVATION_TABLE{
    0xA0, 0xC5, 0x06, 0x0E, 0x14, 0xB7, 0x22, 0x60,
    0x08, 0xCE, 0x93, 0x12, 0x56, 0x40, 0x33, 0xF7};
const std::array<uint8_t, 3> UNLOCK_PREFIX{0x21, 0xD0, 0x00};
const std::array<uint8_t, 8> GEN3_SALT{0x89, 0x81, 0x0C, 0xC4, 0x08, 0x98, 0x17, 0x7A};

namespace {

// RAII-обёртка над контекстом AES
struct AesContext {
  mbedtls_aes_context ctx;
  AesContext() { mbedtls_aes_init(&ctx); }
  ~AesContext() { mbedtls_aes_free(&ctx); }
  AesContext(const AesContext&) = delete;
  AesContext& operator=(const AesContext&) = delete;
};

} // namespace

std::vector<uint8_t> deriveUnlockKey(const std::vector<uint8_t>& patchInfo) {
  if (patchInfo.size() < MIN_PATCH_INFO) {
    LOG_WARN("CgmCrypto: patchInfo слишком короткий (%u байт)",
             static_cast<unsigned>(patchInfo.size()));
    return {};
  }
  std::vector<uint8_t> out(UNLOCK_PREFIX.begin(), UNLOCK_PREFIX.end());
  out.reserve(UNLOCK_KEY_SIZE);
  for (size_t i = 0; i < 8; ++i) {
    out.push_back(static_cast<uint8_t>(patchInfo[i % patchInfo.size()] ^ KEY_DERIVATION_TABLE[i]));
  }
  return out;
}

std::array<uint8_t, 16> deriveGen2Key(const std::vector<uint8_t>& patchInfo) {
  std::array<uint8_t, 16> key{};
  for (size_t i = 0; i < key.size(); ++i) {
    const uint8_t src = i < patchInfo.size() ? patchInfo[i] : 0;  // недостающие байты — нули
    key[i] = static_cast<uint8_t>(src ^ KEY_DERIVATION_TABLE[i]);
  }
  return key;
}

std::array<uint8_t, 16> deriveGen2Iv(const std::vector<uint8_t>& patchInfo) {
  std::array<uint8_t, 16> iv{};
  if (patchInfo.empty()) return iv;
  for (size_t i = 0; i < iv.size(); ++i) {
    iv[i] = static_cast<uint8_t>(patchInfo[(i + 8) % patchInfo.size()] ^
                                 KEY_DERIVATION_TABLE[(i + 8) % KEY_DERIVATION_TABLE.size()]);
  }
  return iv;
}

std::vector<uint8_t> decryptGen2(const std::vector<uint8_t>& data,
                                 const std::vector<uint8_t>& patchInfo) {
  if (data.size() < BLOCK_SIZE || patchInfo.empty()) {
    return data;  // ещё не зашифровано
  }
  std::vector<uint8_t> out(data.begin(), data.begin() + GEN2_HEADER_SIZE);
  const size_t remaining = data.size() - GEN2_HEADER_SIZE;
  const size_t aligned = remaining - remaining % BLOCK_SIZE;
  if (aligned == 0) {
    return data;
  }
  std::array<uint8_t, 16> key = deriveGen2Key(patchInfo);
  std::array<uint8_t, 16> iv = deriveGen2Iv(patchInfo);
  AesContext aes;
  std::vector<uint8_t> plain(aligned);
  int rc = mbedtls_aes_setkey_dec(&aes.ctx, key.data(), 128);
  if (rc == 0) {
    rc = mbedtls_aes_crypt_cbc(&aes.ctx, MBEDTLS_AES_DECRYPT, aligned, iv.data(),
                               data.data() + GEN2_HEADER_SIZE, plain.data());
  }
  sodium_memzero(key.data(), key.size());
  if (rc != 0) {
    LOG_ERROR("CgmCrypto: ошибка AES-CBC (%d), данные переданы без расшифровки", rc);
    return data;
  }
  out.insert(out.end(), plain.begin(), plain.end());
  // Хвост короче блока копируется как есть
  out.insert(out.end(), data.begin() + GEN2_HEADER_SIZE + aligned, data.end());
  return out;
}

std::vector<uint8_t> decryptGen3(const std::vector<uint8_t>& data,
                                 const std::vector<uint8_t>& sessionKey) {
  if (data.size() < BLOCK_SIZE || sessionKey.size() < BLOCK_SIZE) {
    return data;
  }
  std::array<uint8_t, 16> counter{};
  std::copy(data.begin(), data.begin() + BLOCK_SIZE, counter.begin());
  std::array<uint8_t, 16> stream{};
  size_t offset = 0;
  const size_t cipherLen = data.size() - BLOCK_SIZE;
  std::vector<uint8_t> plain(cipherLen);
  AesContext aes;
  int rc = mbedtls_aes_setkey_enc(&aes.ctx, sessionKey.data(), 128);
  if (rc == 0 && cipherLen > 0) {
    rc = mbedtls_aes_crypt_ctr(&aes.ctx, cipherLen, &offset, counter.data(), stream.data(),
                               data.data() + BLOCK_SIZE, plain.data());
  }
  sodium_memzero(stream.data(), stream.size());
  if (rc != 0) {
    LOG_ERROR("CgmCrypto: ошибка AES-CTR (%d), данные переданы без расшифровки", rc);
    return data;
  }
  return plain;
}

std::vector<uint8_t> deriveGen3SessionKey(const std::vector<uint8_t>& deviceInfo,
                                          const std::vector<uint8_t>& sensorRandom) {
  std::vector<uint8_t> combined;
  combined.reserve(deviceInfo.size() + sensorRandom.size() + GEN3_SALT.size());
  combined.insert(combined.end(), deviceInfo.begin(), deviceInfo.end());
  combined.insert(combined.end(), sensorRandom.begin(), sensorRandom.end());
  combined.insert(combined.end(), GEN3_SALT.begin(), GEN3_SALT.end());

  std::vector<uint8_t> key(SESSION_KEY_SIZE, 0);
  for (size_t i = 0; i < combined.size(); ++i) {
    key[i % SESSION_KEY_SIZE] ^= combined[i];
  }
  // Перемешивание: каждый байт влияет на следующий
  for (size_t i = 0; i < SESSION_KEY_SIZE; ++i) {
    key[(i + 1) % SESSION_KEY_SIZE] ^= static_cast<uint8_t>(key[i] >> 3);
  }
  sodium_memzero(combined.data(), combined.size());
  return key;
}

uint16_t crc16(const uint8_t* data, size_t len) {
  uint16_t crc = 0xFFFF;
  for (size_t i = 0; i < len; ++i) {
    crc ^= data[i];
    for (int bit = 0; bit < 8; ++bit) {
      if (crc & 0x0001) {
        crc = static_cast<uint16_t>((crc >> 1) ^ 0x8408);
      } else {
        crc >>= 1;
      }
    }
  }
  return static_cast<uint16_t>(crc ^ 0xFFFF);
}

uint16_t crc16(const std::vector<uint8_t>& data) {
  return crc16(data.data(), data.size());
}

bool verifyCrc16(const std::vector<uint8_t>& data, uint16_t expected) {
  return crc16(data) == expected;
}

void wipe(std::vector<uint8_t>& secret) {
  if (!secret.empty()) {
    sodium_memzero(secret.data(), secret.size());
  }
  secret.clear();
}

} // namespace CgmCrypto
