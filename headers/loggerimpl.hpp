#ifndef BASALT_LOGGERIMPL_HPP
#define BASALT_LOGGERIMPL_HPP


#include <atomic>
#include <cstdio>
#include <mutex>
#include <utility>

enum LogLevel
{
    LOG_INFO, LOG_WARN, LOG_ERR
};

/**
 * printf-style logger. Every line is prefixed with the wall-clock time and
 * level and written under a lock so lines from different workers never interleave.
 */
class Logger
{
public:
    inline void set_level(LogLevel minimum) { level = minimum; }

    [[nodiscard]] inline LogLevel get_level() const { return level; }

    void info(const char* str);

    template<typename... Args>
    void info(const char* str, Args... args)
    {
        if (level <= LOG_INFO)
        {
            std::lock_guard<std::mutex> lock(mutex);
            prefix(stdout, "INFO");
            printf(str, std::forward<Args>(args)...);
            printf("\n");
        }
    }

    void warn(const char* str);

    template<typename... Args>
    void warn(const char* str, Args... args)
    {
        if (level <= LOG_WARN)
        {
            std::lock_guard<std::mutex> lock(mutex);
            prefix(stdout, "WARN");
            printf(str, std::forward<Args>(args)...);
            printf("\n");
        }
    }

    void err(const char* str);

    template<typename... Args>
    void err(const char* str, Args... args)
    {
        std::lock_guard<std::mutex> lock(mutex);
        prefix(stderr, "ERR");
        fprintf(stderr, str, std::forward<Args>(args)...);
        fprintf(stderr, "\n");
    }
private:
    static void prefix(FILE* stream, const char* tag);

    std::atomic<LogLevel> level{LOG_INFO};
    std::mutex mutex;
};

/**
 * @return The process-wide logger.
 */
Logger& logger();

/**
 * Parses "info", "warn" or "err".
 * @return false if the name is not a level.
 */
bool parse_log_level(const char* name, LogLevel& out);


#endif //BASALT_LOGGERIMPL_HPP
