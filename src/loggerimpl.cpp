#include <cstring>
#include <ctime>
#include "loggerimpl.hpp"

static Logger logs;

Logger& logger()
{
    return logs;
}

void Logger::prefix(FILE* stream, const char* tag)
{
    time_t now = time(nullptr);
    tm local{};
    localtime_r(&now, &local);

    char stamp[16];
    strftime(stamp, sizeof(stamp), "%H:%M:%S", &local);
    fprintf(stream, "[%s %s] ", stamp, tag);
}

void Logger::info(const char* str)
{
    if (level <= LOG_INFO)
    {
        std::lock_guard<std::mutex> lock(mutex);
        prefix(stdout, "INFO");
        printf("%s\n", str);
    }
}

void Logger::warn(const char* str)
{
    if (level <= LOG_WARN)
    {
        std::lock_guard<std::mutex> lock(mutex);
        prefix(stdout, "WARN");
        printf("%s\n", str);
    }
}

void Logger::err(const char* str)
{
    std::lock_guard<std::mutex> lock(mutex);
    prefix(stderr, "ERR");
    fprintf(stderr, "%s\n", str);
}

bool parse_log_level(const char* name, LogLevel& out)
{
    if (strcmp(name, "info") == 0)
    {
        out = LOG_INFO;
    } else if (strcmp(name, "warn") == 0)
    {
        out = LOG_WARN;
    } else if (strcmp(name, "err") == 0)
    {
        out = LOG_ERR;
    } else
    {
        return false;
    }
    return true;
}
