//
//  gadgets.cpp
//  asegnc
//

#include "utils/gadgets.hpp"

#include <ctime>
#include <cstdio>

namespace Gadget {

static std::string format_time(std::chrono::system_clock::time_point tp, const char* fmt)
{
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    char buf[64];
    std::strftime(buf, sizeof(buf), fmt, &tm_buf);
    return buf;
}

void Timer::setTime()
{
    start_ = std::chrono::steady_clock::now();
    end_   = start_;
    stamp_ = std::chrono::system_clock::now();
}

void Timer::getTime()
{
    end_   = std::chrono::steady_clock::now();
    stamp_ = std::chrono::system_clock::now();
}

double Timer::getElapse() const
{
    return std::chrono::duration<double>(end_ - start_).count();
}

std::string Timer::getDate() const
{
    return format_time(stamp_, "%a %b %d %H:%M:%S %Y");
}

std::string Timer::format(double seconds) const
{
    long total = (long)seconds;
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%02ld:%02ld:%02ld (%.3f sec)",
                  total / 3600, (total % 3600) / 60, total % 60, seconds);
    return buf;
}

std::string iso_now()
{
    return format_time(std::chrono::system_clock::now(), "%Y-%m-%dT%H:%M:%S");
}

}
