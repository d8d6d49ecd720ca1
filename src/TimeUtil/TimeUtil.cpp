#include "TimeUtil.hpp"
#include "UsageTypes.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>


// Desc: read exactly n decimal digits at pos
// In: const std::string& s, size_t pos, size_t n, int& out
// Out: bool (false if any char is not a digit or string too short)
static bool read_digits(const std::string& s, size_t pos, size_t n, int& out) {
    if (pos + n > s.size()) return false;
    int v = 0;
    for (size_t i = 0; i < n; ++i) {
        unsigned char c = static_cast<unsigned char>(s[pos + i]);
        if (!std::isdigit(c)) return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    return true;
}

bool parse_rfc3339(const std::string& ts, int64_t& out_ns) {
    // YYYY-MM-DDTHH:MM:SS
    if (ts.size() < 20) return false;
    int year, mon, day, hour, min, sec;
    if (!read_digits(ts, 0, 4, year) || ts[4] != '-' ||
        !read_digits(ts, 5, 2, mon)  || ts[7] != '-' ||
        !read_digits(ts, 8, 2, day)) return false;
    if (ts[10] != 'T' && ts[10] != 't' && ts[10] != ' ') return false;
    if (!read_digits(ts, 11, 2, hour) || ts[13] != ':' ||
        !read_digits(ts, 14, 2, min)  || ts[16] != ':' ||
        !read_digits(ts, 17, 2, sec)) return false;

    if (mon < 1 || mon > 12 || day < 1 || day > 31 ||
        hour > 23 || min > 59 || sec > 60) return false;

    size_t pos = 19;
    int64_t frac_ns = 0;
    if (pos < ts.size() && ts[pos] == '.') {
        ++pos;
        size_t digits = 0;
        int64_t scale = 100000000LL;
        while (pos < ts.size() && std::isdigit(static_cast<unsigned char>(ts[pos]))) {
            if (digits < 9) {
                frac_ns += (ts[pos] - '0') * scale;
                scale /= 10;
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) return false;
    }

    if (pos >= ts.size()) return false;
    int64_t offset_sec = 0;
    const char z = ts[pos];
    if (z == 'Z' || z == 'z') {
        ++pos;
    } else if (z == '+' || z == '-') {
        int oh, om;
        if (!read_digits(ts, pos + 1, 2, oh) || ts.size() <= pos + 3 || ts[pos + 3] != ':' ||
            !read_digits(ts, pos + 4, 2, om)) return false;
        if (oh > 23 || om > 59) return false;
        offset_sec = (oh * 3600 + om * 60) * (z == '+' ? 1 : -1);
        pos += 6;
    } else {
        return false;
    }
    if (pos != ts.size()) return false;

    struct tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon  = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min  = min;
    tm.tm_sec  = sec;
    const time_t t = timegm(&tm);
    // timegm normalizes out-of-range days (Feb 30); reject those
    if (tm.tm_mday != day || tm.tm_mon != mon - 1) return false;

    out_ns = (static_cast<int64_t>(t) - offset_sec) * kNsPerSecond + frac_ns;
    return true;
}

std::string format_rfc3339(int64_t ns) {
    int64_t secs = ns / kNsPerSecond;
    int64_t rem  = ns % kNsPerSecond;
    if (rem < 0) { rem += kNsPerSecond; --secs; }
    const time_t t = static_cast<time_t>(secs);
    struct tm tm{};
    gmtime_r(&t, &tm);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<int>(rem / 1000000LL));
    return buf;
}

int64_t now_ns_realtime() {
    struct timespec ts{};
    clock_gettime(CLOCK_REALTIME, &ts);
    return (int64_t)ts.tv_sec * 1000000000LL + (int64_t)ts.tv_nsec;
}
