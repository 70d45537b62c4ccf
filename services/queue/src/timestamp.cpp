#include "../include/timestamp.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <stdexcept>

Timestamp now_micros() {
    using namespace std::chrono;
    return duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
}

std::string format_iso8601(Timestamp ts) {
    std::time_t secs = static_cast<std::time_t>(ts / 1000000);
    long micros = static_cast<long>(ts % 1000000);
    if (micros < 0) { micros += 1000000; --secs; }
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[40];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ldZ",
             tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
             tm.tm_hour, tm.tm_min, tm.tm_sec, micros);
    return std::string(buf);
}

Timestamp parse_iso8601(const std::string& s) {
    std::tm tm{};
    int year = 0, mon = 0, day = 0, hour = 0, min = 0, sec = 0;
    int consumed = 0;
    if (sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &year, &mon, &day, &hour, &min, &sec, &consumed) != 6) {
        throw std::invalid_argument("invalid ISO-8601 timestamp: " + s);
    }
    long micros = 0;
    std::size_t pos = static_cast<std::size_t>(consumed);
    if (pos < s.size() && s[pos] == '.') {
        long scale = 100000;
        ++pos;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
            micros += (s[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
    }
    if (pos < s.size() && s[pos] != 'Z') {
        throw std::invalid_argument("only UTC timestamps are supported: " + s);
    }
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    return static_cast<Timestamp>(timegm(&tm)) * 1000000 + micros;
}
