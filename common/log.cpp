#include "log.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

int common_log_verbosity_thold = LOG_DEFAULT_VERBOSITY;

void common_log_set_verbosity_thold(int verbosity) {
    common_log_verbosity_thold = verbosity;
}

static int64_t t_us() {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

static const char * level_prefix(enum common_log_level level) {
    switch (level) {
        case COMMON_LOG_LEVEL_DEBUG: return "D ";
        case COMMON_LOG_LEVEL_INFO:  return "I ";
        case COMMON_LOG_LEVEL_WARN:  return "W ";
        case COMMON_LOG_LEVEL_ERROR: return "E ";
        default:                     return "";
    }
}

struct common_log {
    std::mutex mtx;

    bool paused     = false;
    bool prefix     = false;
    bool timestamps = false;

    FILE * file = nullptr;

    int64_t t_start = t_us();

    std::vector<char> msg = std::vector<char>(256);

    ~common_log() {
        if (file) {
            fclose(file);
        }
    }

    void add(enum common_log_level level, const char * fmt, va_list args) {
        std::lock_guard<std::mutex> lock(mtx);

        if (paused) {
            return;
        }

        va_list args_copy;
        va_copy(args_copy, args);

        const int n = vsnprintf(msg.data(), msg.size(), fmt, args);
        if (n < 0) {
            va_end(args_copy);
            return;
        }
        if (static_cast<size_t>(n) >= msg.size()) {
            msg.resize(n + 1);
            vsnprintf(msg.data(), msg.size(), fmt, args_copy);
        }
        va_end(args_copy);

        std::string line;
        if (timestamps) {
            const int64_t t = t_us() - t_start;
            char ts[32];
            snprintf(ts, sizeof(ts), "%d.%02d.%03d ",
                    (int) (t / 1000000 / 60),
                    (int) (t / 1000000 % 60),
                    (int) (t / 1000 % 1000));
            line += ts;
        }
        if (prefix) {
            line += level_prefix(level);
        }
        line += msg.data();

        FILE * out = level >= COMMON_LOG_LEVEL_WARN ? stderr : stdout;
        fputs(line.c_str(), out);
        fflush(out);

        if (file) {
            fputs(line.c_str(), file);
            fflush(file);
        }
    }
};

struct common_log * common_log_main() {
    static struct common_log log;
    return &log;
}

void common_log_pause(struct common_log * log) {
    std::lock_guard<std::mutex> lock(log->mtx);
    log->paused = true;
}

void common_log_resume(struct common_log * log) {
    std::lock_guard<std::mutex> lock(log->mtx);
    log->paused = false;
}

void common_log_add(struct common_log * log, enum common_log_level level, const char * fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log->add(level, fmt, args);
    va_end(args);
}

void common_log_set_file(struct common_log * log, const char * file) {
    std::lock_guard<std::mutex> lock(log->mtx);
    if (log->file) {
        fclose(log->file);
        log->file = nullptr;
    }
    if (file) {
        log->file = fopen(file, "w");
    }
}

void common_log_set_prefix(struct common_log * log, bool prefix) {
    std::lock_guard<std::mutex> lock(log->mtx);
    log->prefix = prefix;
}

void common_log_set_timestamps(struct common_log * log, bool timestamps) {
    std::lock_guard<std::mutex> lock(log->mtx);
    log->timestamps = timestamps;
}
