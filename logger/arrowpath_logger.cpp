#include "arrowpath_logger.hpp"
#include <zf_log.h>

#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>

namespace arrowpath {

namespace {

struct LevelStyle {
    const char* name;
    const char* color;
};

LevelStyle style_for(int level)
{
    switch (level) {
        case LOG_VERBOSE: return {"VERBOSE", "\x1b[32m"};
        case LOG_DEBUG:   return {"DEBUG", "\x1b[34m"};
        case LOG_INFO:    return {"INFO", "\x1b[37m"};
        case LOG_WARN:    return {"WARN", "\x1b[33m"};
        case LOG_ERROR:   return {"ERROR", "\x1b[31m"};
        case LOG_FATAL:   return {"FATAL", "\x1b[31;1m"};
        default:          return {"NONE", "\x1b[37m"};
    }
}

constexpr const char* COLOR_RESET = "\x1b[0m";

// State behind the zf_log callback. One per process, handed to zf_log as
// the callback argument.
struct LogSink {
    std::mutex mutex;
    LogOptions options;
    FILE* file = nullptr;
    bool installed = false;

    void close_file()
    {
        if (file) {
            fclose(file);
            file = nullptr;
        }
    }
};

LogSink& sink()
{
    static LogSink instance;
    return instance;
}

// HH:MM:SS.mmm
void format_timestamp(char* out, size_t size)
{
    using namespace std::chrono;
    const auto now = system_clock::now();
    const time_t t = system_clock::to_time_t(now);
    const long ms = static_cast<long>(duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);

    struct tm tm_buf;
    if (localtime_r(&t, &tm_buf) == nullptr) {
        out[0] = '\0';
        return;
    }
    char hms[16];
    strftime(hms, sizeof(hms), "%H:%M:%S", &tm_buf);
    snprintf(out, size, "%s.%03ld", hms, ms);
}

void write_message(const zf_log_message* msg, void* arg)
{
    LogSink* target = static_cast<LogSink*>(arg);

    char stamp[32];
    format_timestamp(stamp, sizeof(stamp));
    const LevelStyle style = style_for(msg->lvl);
    const int len = static_cast<int>(msg->p - msg->msg_b);

    std::lock_guard<std::mutex> lock(target->mutex);
    if (target->options.color) {
        fprintf(stdout, "%s%s %-5s %.*s%s\n", style.color, stamp, style.name, len, msg->msg_b, COLOR_RESET);
    } else {
        fprintf(stdout, "%s %-5s %.*s\n", stamp, style.name, len, msg->msg_b);
    }
    fflush(stdout);

    if (target->file) {
        fprintf(target->file, "%s %-5s %.*s\n", stamp, style.name, len, msg->msg_b);
        fflush(target->file);
    }
}

void close_at_exit()
{
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.close_file();
}

} // namespace

Result<Empty, Error> start_logging(const LogOptions& options)
{
    LogSink& s = sink();
    bool opened = true;
    {
        std::lock_guard<std::mutex> lock(s.mutex);
        s.close_file();
        s.options = options;

        if (!options.file.empty()) {
            s.file = fopen(options.file.c_str(), "a");
            opened = s.file != nullptr;
        }

        if (!s.installed) {
            zf_log_set_output_v(ZF_LOG_PUT_STD, &s, write_message);
            atexit(close_at_exit);
            s.installed = true;
        }
    }
    zf_log_set_output_level(options.level);

    if (!opened) {
        ZF_LOGW(ZF_ADD_LOCATION("could not open log file %s, console only", options.file.c_str()));
        return Error::LogFileError;
    }
    ZF_LOGD("logging at %s%s%s", log_level_name(options.level),
        options.file.empty() ? "" : " to ", options.file.c_str());
    return Empty{};
}

void stop_logging()
{
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.close_file();
    s.options.file.clear();
}

bool logging_started()
{
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.installed;
}

const LogOptions& current_log_options()
{
    return sink().options;
}

Result<int, Error> parse_log_level(const std::string& name)
{
    for (int level = LOG_VERBOSE; level <= LOG_FATAL; level++) {
        std::string candidate = style_for(level).name;
        for (auto& c : candidate) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (candidate == name) {
            return level;
        }
    }
    return Error::UnknownLogLevel;
}

const char* log_level_name(int level)
{
    return style_for(level).name;
}

} // namespace arrowpath
