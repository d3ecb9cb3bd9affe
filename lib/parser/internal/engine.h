#ifndef __heapgraph_parser_engine_h__
#define __heapgraph_parser_engine_h__

#include "../include/parser.h"

#include "reader.h"

namespace heapgraph::internal::parser {

    /**
     * Decoding steps of an HPROF file, one function per record or sub-record kind.
     * <p>
     * Functions with a "next" parameter dispatch nested records through it. In production "next" is the engine
     * itself; tests pass a mock engine to observe or replace the nested calls.
     */
    class HeapParserEngine {
    public:
        virtual ~HeapParserEngine() = default;

        virtual void Parse(reader::Reader &reader, heap::Heap &heap, DecodeContext &context,
                           const HeapParserEngine &next) const = 0;

        virtual void ParseHeader(reader::Reader &reader, heap::Heap &heap) const = 0;

        virtual void ParseStringRecord(reader::Reader &payload, heap::Heap &heap) const = 0;

        virtual void ParseLoadClassRecord(reader::Reader &payload, heap::Heap &heap) const = 0;

        virtual void ParseHeapContent(reader::Reader &payload, heap::Heap &heap, DecodeContext &context,
                                      const HeapParserEngine &next) const = 0;

        /**
         * Second pass over the open segment group: resolves every buffered record in stream order, then closes the
         * group.
         */
        virtual void ResolveGroup(heap::Heap &heap, DecodeContext &context) const = 0;

        virtual size_t ParseHeapContentRootUnknownSubRecord(reader::Reader &reader, heap::Heap &heap) const = 0;

        virtual size_t ParseHeapContentRootJniGlobalSubRecord(reader::Reader &reader, heap::Heap &heap) const = 0;

        virtual size_t ParseHeapContentRootJniLocalSubRecord(reader::Reader &reader, heap::Heap &heap) const = 0;

        virtual size_t ParseHeapContentRootJavaFrameSubRecord(reader::Reader &reader, heap::Heap &heap) const = 0;

        virtual size_t ParseHeapContentRootNativeStackSubRecord(reader::Reader &reader, heap::Heap &heap) const = 0;

        virtual size_t ParseHeapContentRootStickyClassSubRecord(reader::Reader &reader, heap::Heap &heap) const = 0;

        virtual size_t ParseHeapContentRootThreadBlockSubRecord(reader::Reader &reader, heap::Heap &heap) const = 0;

        virtual size_t ParseHeapContentRootMonitorUsedSubRecord(reader::Reader &reader, heap::Heap &heap) const = 0;

        virtual size_t ParseHeapContentRootThreadObjectSubRecord(reader::Reader &reader, heap::Heap &heap) const = 0;

        virtual size_t
        ParseHeapContentClassSubRecord(reader::Reader &reader, heap::Heap &heap, DecodeContext &context) const = 0;

        virtual size_t ParseHeapContentInstanceSubRecord(reader::Reader &reader, heap::Heap &heap) const = 0;

        virtual size_t ParseHeapContentObjectArraySubRecord(reader::Reader &reader, heap::Heap &heap) const = 0;

        virtual size_t ParseHeapContentPrimitiveArraySubRecord(reader::Reader &reader, heap::Heap &heap) const = 0;
    };

    /**
     * Parser engine implementation, see HeapParserEngine.
     */
    class HeapParserEngineImpl final : public HeapParserEngine {
    public:
        void Parse(reader::Reader &reader, heap::Heap &heap, DecodeContext &context,
                   const HeapParserEngine &next) const override;

        void ParseHeader(reader::Reader &reader, heap::Heap &heap) const override;

        void ParseStringRecord(reader::Reader &payload, heap::Heap &heap) const override;

        void ParseLoadClassRecord(reader::Reader &payload, heap::Heap &heap) const override;

        void ParseHeapContent(reader::Reader &payload, heap::Heap &heap, DecodeContext &context,
                              const HeapParserEngine &next) const override;

        void ResolveGroup(heap::Heap &heap, DecodeContext &context) const override;

        size_t ParseHeapContentRootUnknownSubRecord(reader::Reader &reader, heap::Heap &heap) const override;

        size_t ParseHeapContentRootJniGlobalSubRecord(reader::Reader &reader, heap::Heap &heap) const override;

        size_t ParseHeapContentRootJniLocalSubRecord(reader::Reader &reader, heap::Heap &heap) const override;

        size_t ParseHeapContentRootJavaFrameSubRecord(reader::Reader &reader, heap::Heap &heap) const override;

        size_t ParseHeapContentRootNativeStackSubRecord(reader::Reader &reader, heap::Heap &heap) const override;

        size_t ParseHeapContentRootStickyClassSubRecord(reader::Reader &reader, heap::Heap &heap) const override;

        size_t ParseHeapContentRootThreadBlockSubRecord(reader::Reader &reader, heap::Heap &heap) const override;

        size_t ParseHeapContentRootMonitorUsedSubRecord(reader::Reader &reader, heap::Heap &heap) const override;

        size_t ParseHeapContentRootThreadObjectSubRecord(reader::Reader &reader, heap::Heap &heap) const override;

        size_t
        ParseHeapContentClassSubRecord(reader::Reader &reader, heap::Heap &heap, DecodeContext &context) const override;

        size_t ParseHeapContentInstanceSubRecord(reader::Reader &reader, heap::Heap &heap) const override;

        size_t ParseHeapContentObjectArraySubRecord(reader::Reader &reader, heap::Heap &heap) const override;

        size_t ParseHeapContentPrimitiveArraySubRecord(reader::Reader &reader, heap::Heap &heap) const override;
    };
}

#endif
