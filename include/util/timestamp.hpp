#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

namespace unistore::util {

// "Sun, 06 Nov 1994 08:49:37 GMT", as required by the x-ms-date header.
inline std::string getRfc1123Date(const std::chrono::system_clock::time_point tp = std::chrono::system_clock::now()) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    static constexpr const char* days[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static constexpr const char* months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                             "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%s, %02d %s %04d %02d:%02d:%02d GMT",
                  days[tm.tm_wday], tm.tm_mday, months[tm.tm_mon], tm.tm_year + 1900,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    return {buffer};
}

} // namespace unistore::util
