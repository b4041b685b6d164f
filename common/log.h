#pragma once

#include <cstdarg>
#include <cstdio>

#ifndef __GNUC__
#    define LOG_ATTRIBUTE_FORMAT(...)
#elif defined(__MINGW32__) && !defined(__clang__)
#    define LOG_ATTRIBUTE_FORMAT(...) __attribute__((format(gnu_printf, __VA_ARGS__)))
#else
#    define LOG_ATTRIBUTE_FORMAT(...) __attribute__((format(printf, __VA_ARGS__)))
#endif

enum common_log_level {
    COMMON_LOG_LEVEL_DEBUG,
    COMMON_LOG_LEVEL_INFO,
    COMMON_LOG_LEVEL_WARN,
    COMMON_LOG_LEVEL_ERROR,
};

#define LOG_DEFAULT_DEBUG 1
#define LOG_DEFAULT_VERBOSITY 0

// messages with verbosity above this threshold are dropped
extern int common_log_verbosity_thold;

void common_log_set_verbosity_thold(int verbosity);

struct common_log;

// process-wide logger used by the LOG_* macros
struct common_log * common_log_main();

void common_log_pause (struct common_log * log);
void common_log_resume(struct common_log * log);

void common_log_add(struct common_log * log, enum common_log_level level, const char * fmt, ...) LOG_ATTRIBUTE_FORMAT(3, 4);

// also write every entry to this file (nullptr closes it)
void common_log_set_file      (struct common_log * log, const char * file);
void common_log_set_prefix    (struct common_log * log, bool prefix);
void common_log_set_timestamps(struct common_log * log, bool timestamps);

//
// macros
//
//   LOG_INF("connected to %s\n", url.c_str());
//   LOG_DBG("delivery %llu\n", (unsigned long long) tag);
//

#define LOG_TMPL(level, verbosity, ...) \
    do { \
        if ((verbosity) <= common_log_verbosity_thold) { \
            common_log_add(common_log_main(), (level), __VA_ARGS__); \
        } \
    } while (0)

#define LOG(...)             LOG_TMPL(COMMON_LOG_LEVEL_INFO,  0,                 __VA_ARGS__)
#define LOGV(verbosity, ...) LOG_TMPL(COMMON_LOG_LEVEL_INFO,  verbosity,         __VA_ARGS__)

#define LOG_INF(...) LOG_TMPL(COMMON_LOG_LEVEL_INFO,  0,                 __VA_ARGS__)
#define LOG_WRN(...) LOG_TMPL(COMMON_LOG_LEVEL_WARN,  0,                 __VA_ARGS__)
#define LOG_ERR(...) LOG_TMPL(COMMON_LOG_LEVEL_ERROR, 0,                 __VA_ARGS__)
#define LOG_DBG(...) LOG_TMPL(COMMON_LOG_LEVEL_DEBUG, LOG_DEFAULT_DEBUG, __VA_ARGS__)
