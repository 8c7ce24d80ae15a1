#ifndef SMPP_LOG_H
#define SMPP_LOG_H
#include <stdio.h>
#include <sys/types.h>

namespace smpp {

enum LogLevel {
    LOG_LEVEL_DEBUG = 0,
    LOG_LEVEL_INFO = 1,
    LOG_LEVEL_WARN = 2,
    LOG_LEVEL_ERROR = 3,
    LOG_LEVEL_FATAL = 4
};

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

ssize_t setLogLevelString(const char *level);

void logPrintf(LogLevel level, const char *func, const char *fmt, ...) __attribute__((format(printf, 3, 4)));

}

#define log_debug(fmt, ...) smpp::logPrintf(smpp::LOG_LEVEL_DEBUG, __func__, fmt, ##__VA_ARGS__)
#define log_info(fmt, ...) smpp::logPrintf(smpp::LOG_LEVEL_INFO, __func__, fmt, ##__VA_ARGS__)
#define log_warn(fmt, ...) smpp::logPrintf(smpp::LOG_LEVEL_WARN, __func__, fmt, ##__VA_ARGS__)
#define log_error(fmt, ...) smpp::logPrintf(smpp::LOG_LEVEL_ERROR, __func__, fmt, ##__VA_ARGS__)
#define log_fatal(fmt, ...) smpp::logPrintf(smpp::LOG_LEVEL_FATAL, __func__, fmt, ##__VA_ARGS__)

#endif // SMPP_LOG_H
