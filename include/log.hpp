#pragma once

#include <iostream>

// Higher is chattier. Set from CMake with MOTION_RETARGET_LOG_LEVEL.
#define LOG_LEVEL_SILENT  0
#define LOG_LEVEL_WARN    1
#define LOG_LEVEL_INFO    2
#define LOG_LEVEL_VERBOSE 3  // per-frame: skipped joints, calibration

#ifndef LOG_LEVEL
#define LOG_LEVEL LOG_LEVEL_INFO
#endif

// Warnings go to stderr so they survive `> log.txt`
#define LOG_AT(level, stream, msg) \
    do { if (LOG_LEVEL >= (level)) { (stream) << msg << std::endl; } } while (0)

#define LOG_VERBOSE(msg) LOG_AT(LOG_LEVEL_VERBOSE, std::cout, msg)
#define LOG_INFO(msg)    LOG_AT(LOG_LEVEL_INFO, std::cout, msg)
#define LOG_WARN(msg)    LOG_AT(LOG_LEVEL_WARN, std::cerr, msg)

constexpr const char* logLevelName(int level) {
    switch (level) {
        case LOG_LEVEL_SILENT: return "SILENT";
        case LOG_LEVEL_WARN: return "WARN";
        case LOG_LEVEL_INFO: return "INFO";
        case LOG_LEVEL_VERBOSE: return "VERBOSE";
        default: return "UNKNOWN";
    }
}

#define LOG_PRINT_LEVEL() \
    LOG_AT(LOG_LEVEL_INFO, std::cout, "[Log] Level: " << logLevelName(LOG_LEVEL) << " (" << LOG_LEVEL << ")")
