#ifndef TIME_EX_HPP
#define TIME_EX_HPP
#include <chrono>
#include <ctime>
#include <stdint.h>
#include <stdio.h>
#include <string>

inline int64_t now_millisec() {
    std::chrono::system_clock::duration d = std::chrono::system_clock::now().time_since_epoch();

    std::chrono::milliseconds mil = std::chrono::duration_cast<std::chrono::milliseconds>(d);

    return (int64_t)mil.count();
}

inline std::string get_now_str() {
    std::time_t t = std::time(nullptr);
    struct tm tm_now;
    localtime_r(&t, &tm_now);
    char dscr_sz[80];

    int now_ms = (int)(now_millisec()%1000);

    snprintf(dscr_sz, sizeof(dscr_sz), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
        tm_now.tm_year+1900, tm_now.tm_mon+1, tm_now.tm_mday,
        tm_now.tm_hour, tm_now.tm_min, tm_now.tm_sec, now_ms);
    std::string desc(dscr_sz);
    return desc;
}

#endif //TIME_EX_HPP
