#include "include/logger.h"

#include <cstdio>

namespace heapgraph::log {

    static int dummy_log(int, const char *) {
        return 0;
    }

    static log_func_t log_func = dummy_log;
    static log_level_t log_level = kLevelInfo;

    void SetLogFunc(log_func_t func) {
        log_func = func != nullptr ? func : dummy_log;
    }

    void SetLogLevel(log_level_t level) {
        log_level = level;
    }

    log_level_t GetLogLevel() {
        return log_level;
    }

    int Log(int prio, const char *fmt, ...) {
        va_list args;
        va_start(args, fmt);
        const int ret = LogV(prio, fmt, args);
        va_end(args);
        return ret;
    }

    int LogV(int prio, const char *fmt, va_list args) {
        if (prio < log_level) {
            return -1;
        }
        char buf[1024];
        vsnprintf(buf, sizeof(buf), fmt, args);
        return log_func(prio, buf);
    }
}
