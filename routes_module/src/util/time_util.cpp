#include "time_util.h"
#include <cctype>
#include <cstdio>

namespace {

// Количество дней от 1970-01-01 до даты григорианского календаря
long long daysFromCivil(long long y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

void civilFromDays(long long z, long long& y, unsigned& m, unsigned& d) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<long long>(yoe) + era * 400 + (m <= 2);
}

bool isLeapYear(long long y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned daysInMonth(long long y, unsigned m) {
    static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && isLeapYear(y)) return 29;
    return days[m - 1];
}

// Читает ровно count цифр начиная с pos
bool readDigits(const std::string& s, size_t& pos, size_t count, int& value) {
    if (pos + count > s.size()) return false;
    value = 0;
    for (size_t i = 0; i < count; i++) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
    }
    pos += count;
    return true;
}

bool expect(const std::string& s, size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c) return false;
    pos++;
    return true;
}

} // namespace

bool parseTimestamp(const std::string& text, Timestamp& out) {
    size_t pos = 0;
    int year, month, day, hour, minute, second = 0;
    long long micros = 0;

    if (!readDigits(text, pos, 4, year) || !expect(text, pos, '-')) return false;
    if (!readDigits(text, pos, 2, month) || !expect(text, pos, '-')) return false;
    if (!readDigits(text, pos, 2, day)) return false;

    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ')) return false;
    pos++;

    if (!readDigits(text, pos, 2, hour) || !expect(text, pos, ':')) return false;
    if (!readDigits(text, pos, 2, minute)) return false;

    if (pos < text.size() && text[pos] == ':') {
        pos++;
        if (!readDigits(text, pos, 2, second)) return false;

        if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
            pos++;
            size_t digits = 0;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                if (digits < 6) micros = micros * 10 + (text[pos] - '0');
                digits++;
                pos++;
            }
            if (digits == 0) return false;
            for (size_t i = digits; i < 6; i++) micros *= 10;
        }
    }

    long long offsetMinutes = 0;
    if (pos < text.size()) {
        char z = text[pos];
        if (z == 'Z' || z == 'z') {
            pos++;
        } else if (z == '+' || z == '-') {
            pos++;
            int oh, om = 0;
            if (!readDigits(text, pos, 2, oh)) return false;
            if (pos < text.size()) {
                if (text[pos] == ':') pos++;
                if (!readDigits(text, pos, 2, om)) return false;
            }
            if (oh > 23 || om > 59) return false;
            offsetMinutes = (oh * 60 + om) * (z == '-' ? -1 : 1);
        } else {
            return false;
        }
    }
    if (pos != text.size()) return false;

    if (year < 1 || month < 1 || month > 12) return false;
    if (day < 1 || static_cast<unsigned>(day) > daysInMonth(year, month)) return false;
    if (hour > 23 || minute > 59 || second > 59) return false;

    long long days = daysFromCivil(year, month, day);
    long long seconds = days * 86400 + hour * 3600 + minute * 60 + second - offsetMinutes * 60;

    // После учёта смещения момент должен остаться в пределах 0001..9999 годов по UTC
    if (seconds < daysFromCivil(1, 1, 1) * 86400) return false;
    if (seconds >= daysFromCivil(10000, 1, 1) * 86400) return false;

    out = timestampFromMicros(seconds * 1000000 + micros);
    return true;
}

std::string formatTimestamp(Timestamp ts) {
    long long micros = timestampToMicros(ts);
    long long seconds = micros / 1000000;
    long long fraction = micros % 1000000;
    if (fraction < 0) {
        fraction += 1000000;
        seconds -= 1;
    }
    long long days = seconds / 86400;
    long long rem = seconds % 86400;
    if (rem < 0) {
        rem += 86400;
        days -= 1;
    }

    long long y;
    unsigned m, d;
    civilFromDays(days, y, m, d);

    char buf[40];
    int hh = static_cast<int>(rem / 3600);
    int mm = static_cast<int>(rem % 3600 / 60);
    int ss = static_cast<int>(rem % 60);
    if (fraction != 0) {
        std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d.%06lldZ", y, m, d, hh, mm, ss, fraction);
    } else {
        std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02dZ", y, m, d, hh, mm, ss);
    }
    return buf;
}

Timestamp timestampFromMicros(long long micros) {
    return Timestamp(std::chrono::microseconds(micros));
}

long long timestampToMicros(Timestamp ts) {
    return ts.time_since_epoch().count();
}
