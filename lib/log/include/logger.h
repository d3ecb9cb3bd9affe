#ifndef __heapgraph_log_h__
#define __heapgraph_log_h__

#include <cstdarg>

namespace heapgraph::log {

    typedef enum {
        kLevelVerbose = 2,
        kLevelDebug,    // Detailed information on the flow through the decoder.
        kLevelInfo,     // File level events (header, summary), keep to a minimum.
        kLevelWarn,     // Dropped records and objects.
        kLevelError,    // Errors which terminate decoding.
        kLevelFatal,
        kLevelNone,     // Special level used to disable all log messages.
    } log_level_t;

    typedef int (*log_func_t)(int prio, const char *msg);

    /**
     * Installs the function receiving formatted messages. Passing nullptr restores the default one, which drops
     * everything.
     */
    void SetLogFunc(log_func_t func);

    void SetLogLevel(log_level_t level);

    [[nodiscard]] log_level_t GetLogLevel();

    int Log(int prio, const char *fmt, ...)
#ifdef __GNUC__
    __attribute__((format(printf, 2, 3)))
#endif
    ;

    int LogV(int prio, const char *fmt, va_list args);
}

#define hgVerbose(fmt, ...) heapgraph::log::Log(heapgraph::log::kLevelVerbose, (fmt), ##__VA_ARGS__)
#define hgDebug(fmt, ...)   heapgraph::log::Log(heapgraph::log::kLevelDebug, (fmt), ##__VA_ARGS__)
#define hgInfo(fmt, ...)    heapgraph::log::Log(heapgraph::log::kLevelInfo, (fmt), ##__VA_ARGS__)
#define hgWarn(fmt, ...)    heapgraph::log::Log(heapgraph::log::kLevelWarn, (fmt), ##__VA_ARGS__)
#define hgError(fmt, ...)   heapgraph::log::Log(heapgraph::log::kLevelError, (fmt), ##__VA_ARGS__)
#define hgFatal(fmt, ...)   heapgraph::log::Log(heapgraph::log::kLevelFatal, (fmt), ##__VA_ARGS__)

#endif
