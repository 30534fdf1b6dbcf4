#ifndef LOG_H
#define LOG_H

#include <format>
#include <string_view>
#include <glog/logging.h>

// glog behind std::format. Use the INFO/WARN/ERR/FATAL macros, which record
// the calling file and line.
class Log {
public:
    // Safe to call more than once; only the first call initializes glog.
    static void init(const char* program = "cerealizer");
    static void shutdown();

    // 0=INFO, 1=WARNING, 2=ERROR, 3=FATAL
    static void set_min_log_level(int level);

    template<typename... Args>
    static void write(google::LogSeverity severity, const char* file, int line,
                      std::format_string<Args...> fmt, Args&&... args) {
        google::LogMessage(file, line, severity).stream()
            << std::format(fmt, std::forward<Args>(args)...);
    }
};

#ifdef INFO
#undef INFO
#endif
#ifdef WARN
#undef WARN
#endif

#define INFO(...)   ::Log::write(google::GLOG_INFO, __FILE__, __LINE__, __VA_ARGS__)
#define WARN(...)   ::Log::write(google::GLOG_WARNING, __FILE__, __LINE__, __VA_ARGS__)
#define ERR(...)    ::Log::write(google::GLOG_ERROR, __FILE__, __LINE__, __VA_ARGS__)
#define FATAL(...)  ::Log::write(google::GLOG_FATAL, __FILE__, __LINE__, __VA_ARGS__)

#endif // LOG_H
