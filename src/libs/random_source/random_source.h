#pragma once
// Источник криптографически стойких случайных байтов (libsodium)
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace RandomSource {

// Заполняет буфер случайными байтами; false: источник недоступен
using Fill = std::function<bool(uint8_t* out, size_t len)>;

// Инициализация libsodium (идемпотентна)
bool ensureInit();

// Источник по умолчанию на базе randombytes_buf
Fill secure();

// Удобная обёртка: вектор из len случайных байтов, пустой при ошибке
std::vector<uint8_t> bytes(const Fill& fill, size_t len);

} // namespace RandomSource
