#ifndef ARROWPATH_LOGGER_HPP
#define ARROWPATH_LOGGER_HPP

#include "arrowpath.hpp"
#include <cstring>
#include <string>

/**
 * arrowpath logging - routes zf_log output to the console and an optional file
 *
 *   arrowpath::LogOptions options;
 *   options.level = arrowpath::LOG_DEBUG;
 *   options.file = "arrows.log";
 *   auto started = arrowpath::start_logging(options);
 *
 *   ZF_LOGI("arrow %llu rendered", key);
 *
 * Options usually come from the [log] table of the viewer's TOML file.
 * Until start_logging() runs, zf_log writes to stderr on its own.
 */

namespace arrowpath {

// Same values as zf_log's ZF_LOG_* levels
constexpr int LOG_VERBOSE = 1;
constexpr int LOG_DEBUG   = 2;
constexpr int LOG_INFO    = 3;
constexpr int LOG_WARN    = 4;
constexpr int LOG_ERROR   = 5;
constexpr int LOG_FATAL   = 6;

struct LogOptions {
    int level = LOG_INFO;
    std::string file;   // empty: console only
    bool color = true;  // ANSI colors on the console, the file is always plain
};

// Installs the sink, or swaps its options if it is already installed.
// A file that cannot be opened leaves console logging running and
// returns Error::LogFileError.
Result<Empty, Error> start_logging(const LogOptions& options = LogOptions{});

// Closes the log file. Console output keeps going.
void stop_logging();

bool logging_started();
const LogOptions& current_log_options();

// "verbose", "debug", "info", "warn", "error", "fatal"
Result<int, Error> parse_log_level(const std::string& name);
const char* log_level_name(int level);

inline const char* filename(const char* file) {
    const char* slash = std::strrchr(file, '/');
    const char* backslash = std::strrchr(file, '\\');
    return slash ? slash + 1 : (backslash ? backslash + 1 : file);
}

} // namespace arrowpath

// Kept as a macro for __FILE__ and __LINE__
#if ARROWPATH_RELEASE_MODE
    #define ZF_ADD_LOCATION(msg, ...) "%s: " msg, arrowpath::filename(__FILE__), ##__VA_ARGS__
#else
    #define ZF_ADD_LOCATION(msg, ...) "%s @ line: %d: " msg, arrowpath::filename(__FILE__), __LINE__, ##__VA_ARGS__
#endif

#endif // ARROWPATH_LOGGER_HPP
