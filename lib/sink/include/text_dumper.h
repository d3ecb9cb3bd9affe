#ifndef __heapgraph_sink_text_dumper_h__
#define __heapgraph_sink_text_dumper_h__

#include <ostream>

#include "event.h"

namespace heapgraph::sink {

    /**
     * Prints classes with their static fields, instances with their fields and arrays with their elements.
     */
    class TextDumper {
    public:
        explicit TextDumper(std::ostream &out);

        void Handle(const event_t &event);

    private:
        void DumpClass(const ResolvedClass &resolved);

        void DumpInstance(const ResolvedObject &object);

        void DumpObjectArray(const ResolvedObject &object);

        void DumpPrimitiveArray(const ResolvedObject &object);

        void DumpField(const resolved_field_t &field);

        std::ostream &out_;
    };
}

#endif
