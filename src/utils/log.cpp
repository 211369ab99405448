//
//  log.cpp
//  asegnc
//

#include "utils/log.hpp"

#include <iostream>
#include <mutex>
#include <cstring>

std::ostream* g_log = nullptr;
bool g_log_to_console = true;
bool g_log_debug = false;

static std::mutex g_log_mutex;

void log_message(const char* level, const std::string& msg)
{
    // records may come from omp worker threads
    std::lock_guard<std::mutex> lock(g_log_mutex);

    if (g_log_to_console) {
        // errors and warnings go to stderr, the rest to stdout
        std::ostream& os = (std::strcmp(level, "ERROR") == 0 ||
                            std::strcmp(level, "WARN") == 0) ? std::cerr : std::cout;
        os << "[" << level << "] " << msg << "\n";
    }
    if (g_log) {
        (*g_log) << "[" << level << "] " << msg << "\n";
        g_log->flush();
    }
}
