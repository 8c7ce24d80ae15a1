#include "utils/log.hh"

#include <stdarg.h>
#include <stdlib.h>
#include <strings.h>

#define SMPP_LOG_LEVEL_ENV "SMPP_LOG_LEVEL"

namespace smpp {

static const char *LogLevelText[] = {
    "debug",
    "info",
    "warn",
    "error",
    "fatal"
};

static LogLevel _logLevel = LOG_LEVEL_WARN;
static bool _logLevelLoaded = false;

/**
 * @brief parse a level name into a log level.
 * 
 * @param level level name, case insensitive.
 * @param dst where to put the level.
 * @return ssize_t 0 on success, or -1 if the name is not known.
 */
static ssize_t parseLogLevel(const char *level, LogLevel &dst) {
    for (size_t i = 0; i < sizeof(LogLevelText) / sizeof(LogLevelText[0]); ++i) {
        if (strcasecmp(level, LogLevelText[i]) == 0) {
            dst = (LogLevel) i;
            return 0;
        }
    }

    return -1;
}

/**
 * @brief load the initial threshold from the environment, once.
 */
static void loadLogLevel() {
    if (_logLevelLoaded) {
        return;
    }

    _logLevelLoaded = true;

    const char *env = getenv(SMPP_LOG_LEVEL_ENV);

    if (env == nullptr) {
        return;
    }

    if (parseLogLevel(env, _logLevel) < 0) {
        fprintf(stderr, "[WARN ] loadLogLevel: unknown %s value \"%s\", using \"%s\".\n", SMPP_LOG_LEVEL_ENV, env, LogLevelText[_logLevel]);
    }
}

/**
 * @brief set the minimum level of messages to print.
 * 
 * overrides the value read from SMPP_LOG_LEVEL.
 * 
 * @param level new threshold.
 */
void setLogLevel(LogLevel level) {
    _logLevelLoaded = true;
    _logLevel = level;
}

/**
 * @brief get the minimum level of messages to print.
 * 
 * @return LogLevel current threshold.
 */
LogLevel getLogLevel() {
    loadLogLevel();

    return _logLevel;
}

/**
 * @brief set the threshold by name ("debug", "info", "warn", "error" or
 * "fatal").
 * 
 * @param level level name.
 * @return ssize_t 0 on success, or -1 if the name is not known.
 */
ssize_t setLogLevelString(const char *level) {
    LogLevel parsed;

    if (level == nullptr || parseLogLevel(level, parsed) < 0) {
        return -1;
    }

    setLogLevel(parsed);

    return 0;
}

void logPrintf(LogLevel level, const char *func, const char *fmt, ...) {
    if (level < getLogLevel()) {
        return;
    }

    static const char *label[] = { "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL" };

    fprintf(stderr, "[%s] %s: ", label[level], func);

    va_list args;
    va_start(args, fmt);
    vfprintf(stderr, fmt, args);
    va_end(args);
}

}
