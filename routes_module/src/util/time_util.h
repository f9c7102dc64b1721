#pragma once
#include <chrono>
#include <string>

// Момент времени в UTC с точностью до микросекунд
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

// Разбор ISO-8601: YYYY-MM-DDTHH:MM[:SS[.ffffff]][Z|+HH:MM|-HH:MM]
// Без часового пояса время считается UTC
bool parseTimestamp(const std::string& text, Timestamp& out);

// Формат ответа: YYYY-MM-DDTHH:MM:SSZ (дробная часть только если она не нулевая)
std::string formatTimestamp(Timestamp ts);

Timestamp timestampFromMicros(long long micros);
long long timestampToMicros(Timestamp ts);
