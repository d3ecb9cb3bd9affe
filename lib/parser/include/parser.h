#ifndef __heapgraph_parser_h__
#define __heapgraph_parser_h__

#include <memory>
#include <string>
#include <utility>

#include "event.h"
#include "heap.h"
#include "reader.h"

#include "macro.h"

namespace heapgraph::internal::parser {

    /**
     * Options, event handler and running summary of one decode.
     */
    class DecodeContext {
    public:
        DecodeContext(const DecodeOptions &options, event_handler_t handler);

        [[nodiscard]] const DecodeOptions &GetOptions() const {
            return options_;
        }

        [[nodiscard]] const DecodeSummary &GetSummary() const {
            return summary_;
        }

        void Emit(event_t &&event);

        /**
         * Counts, logs and emits a recoverable error.
         */
        void Report(error_kind_t kind, const std::string &message);

        /**
         * Runs \a action. A recoverable HprofError thrown by it is reported and false is returned; fatal errors
         * propagate.
         */
        template<typename Action>
        bool Guard(Action &&action) {
            try {
                std::forward<Action>(action)();
                return true;
            } catch (const HprofError &error) {
                if (error.IsFatal()) throw;
                Report(error.GetKind(), error.what());
                return false;
            }
        }

    private:
        const DecodeOptions options_;
        const event_handler_t handler_;
        DecodeSummary summary_;
    };

    class HeapParserEngine;

    class HeapParser {
    public:
        HeapParser();

    private:
        friend_test(parser, parse);

        explicit HeapParser(HeapParserEngine *engine);

    public:
        ~HeapParser();

        void Parse(reader::Reader &reader, heap::Heap &heap, DecodeContext &context) const;

    private:
        const std::unique_ptr<HeapParserEngine> engine_;
    };
}

#endif
