//
//  gadgets.hpp
//  asegnc
//

#ifndef ASEGNC_GADGETS_HPP
#define ASEGNC_GADGETS_HPP

#include <chrono>
#include <string>

namespace Gadget {

class Timer {
public:
    Timer() { setTime(); }

    void setTime();     // mark start
    void getTime();     // mark end
    double getElapse() const;   // seconds between start and end
    std::string getDate() const;    // local date of the last mark
    std::string format(double seconds) const;

private:
    std::chrono::steady_clock::time_point start_, end_;
    std::chrono::system_clock::time_point stamp_;
};

// ISO 8601 local timestamp, e.g. 2026-10-18T12:30:00
std::string iso_now();

}

#endif
