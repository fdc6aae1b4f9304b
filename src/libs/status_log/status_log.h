#pragma once
#include <cstddef>
#include <string>
#include <vector>

// Журнал статусов сессии: одна актуальная строка на каждый префикс
namespace StatusLog {
// Добавляет строку; строка с тем же префиксом (до первого пробела) заменяется
void logStatus(const std::string& line);
// Возвращает последние count строк журнала
std::vector<std::string> getLast(size_t count);
// Поиск актуальной строки по префиксу, пустая строка если нет
std::string find(const std::string& prefix);
// Очистка журнала
void clear();
}
