//
//  log.hpp
//  asegnc
//

#ifndef ASEGNC_LOG_HPP
#define ASEGNC_LOG_HPP

#include <ostream>
#include <string>

// log sink set by --log, nullptr when logging to console only
extern std::ostream* g_log;
extern bool g_log_to_console;
extern bool g_log_debug;

void log_message(const char* level, const std::string& msg);

#define LOG_INFO(msg)  log_message("INFO",  (msg))
#define LOG_WARN(msg)  log_message("WARN",  (msg))
#define LOG_ERROR(msg) log_message("ERROR", (msg))
#define LOG_DEBUG(msg) do { if (g_log_debug) log_message("DEBUG", (msg)); } while (0)

#endif
