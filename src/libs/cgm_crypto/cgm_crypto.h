#pragma once
// Криптография сенсоров CGM: вывод ключей, AES-CBC/CTR (mbedTLS) и CRC-16
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace CgmCrypto {

constexpr size_t BLOCK_SIZE = 16;             // размер блока AES
constexpr size_t UNLOCK_KEY_SIZE = 11;        // префикс (3) + ключ (8)
constexpr size_t MIN_PATCH_INFO = 6;          // минимальная длина patchInfo
constexpr size_t GEN2_HEADER_SIZE = 8;        // незашифрованный заголовок Gen2
constexpr size_t SESSION_KEY_SIZE = 16;       // размер сеансового ключа Gen3

// Таблица вывода ключей; не является проверенной конструкцией
extern const std::array<uint8_t, 16> KEY_DERIVATION_TABLE;
// Префикс команды разблокировки
extern const std::array<uint8_t, 3> UNLOCK_PREFIX;
// Соль сеансового ключа Gen3
extern const std::array<uint8_t, 8> GEN3_SALT;

// Ключ разблокировки Gen2; пустой результат при patchInfo короче 6 байт
std::vector<uint8_t> deriveUnlockKey(const std::vector<uint8_t>& patchInfo);

// Ключ и IV AES-CBC для Gen2 (используются также тестами для шифрования)
std::array<uint8_t, 16> deriveGen2Key(const std::vector<uint8_t>& patchInfo);
std::array<uint8_t, 16> deriveGen2Iv(const std::vector<uint8_t>& patchInfo);

// Расшифровка ответа Gen2. Короткие данные и ошибки шифра: данные без изменений
std::vector<uint8_t> decryptGen2(const std::vector<uint8_t>& data,
                                 const std::vector<uint8_t>& patchInfo);

// Расшифровка сообщения Gen3 (AES-CTR, счётчик: первые 16 байт данных)
std::vector<uint8_t> decryptGen3(const std::vector<uint8_t>& data,
                                 const std::vector<uint8_t>& sessionKey);

// Сеансовый ключ Gen3 из deviceInfo и случайного числа сенсора
std::vector<uint8_t> deriveGen3SessionKey(const std::vector<uint8_t>& deviceInfo,
                                          const std::vector<uint8_t>& sensorRandom);

// CRC-16 (полином 0x8408, начальное 0xFFFF, финальный XOR 0xFFFF)
uint16_t crc16(const uint8_t* data, size_t len);
uint16_t crc16(const std::vector<uint8_t>& data);
bool verifyCrc16(const std::vector<uint8_t>& data, uint16_t expected);

// Зануление ключевого материала (sodium_memzero)
void wipe(std::vector<uint8_t>& secret);

} // namespace CgmCrypto
