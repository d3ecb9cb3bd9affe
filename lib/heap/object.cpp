#include "include/object.h"

namespace heapgraph {

    const char *gc_root_type_name(gc_root_type_t type) {
        switch (type) {
            case gc_root_type_t::kRootUnknown:
                return "Unknown";
            case gc_root_type_t::kRootJniGlobal:
                return "JniGlobal";
            case gc_root_type_t::kRootJniLocal:
                return "JniLocal";
            case gc_root_type_t::kRootJavaFrame:
                return "JavaFrame";
            case gc_root_type_t::kRootNativeStack:
                return "NativeStack";
            case gc_root_type_t::kRootStickyClass:
                return "StickyClass";
            case gc_root_type_t::kRootThreadBlock:
                return "ThreadBlock";
            case gc_root_type_t::kRootMonitorUsed:
                return "MonitorUsed";
            case gc_root_type_t::kRootThreadObject:
                return "ThreadObject";
        }
        return "Unknown";
    }
}
