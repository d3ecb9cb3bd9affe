#include "include/parser.h"
#include "internal/engine.h"

#include "logger.h"

#include <utility>

namespace heapgraph::internal::parser {

    DecodeContext::DecodeContext(const DecodeOptions &options, event_handler_t handler) :
            options_(options),
            handler_(std::move(handler)),
            summary_() {}

    void DecodeContext::Emit(event_t &&event) {
        if (std::holds_alternative<RecordCounted>(event)) {
            ++summary_.record_count;
        } else if (std::holds_alternative<ClassResolved>(event)) {
            ++summary_.class_count;
        } else if (std::holds_alternative<ObjectResolved>(event)) {
            ++summary_.object_count;
        } else {
            ++summary_.error_counts[std::get<DecodeError>(event).kind];
        }
        if (handler_) handler_(event);
    }

    void DecodeContext::Report(error_kind_t kind, const std::string &message) {
        hgWarn("%s: %s", error_kind_name(kind), message.c_str());
        Emit(DecodeError{.kind = kind, .context = message});
    }

    HeapParser::HeapParser() :
            engine_(new HeapParserEngineImpl()) {}

    HeapParser::HeapParser(HeapParserEngine *engine) :
            engine_(engine) {}

    HeapParser::~HeapParser() = default;

    void HeapParser::Parse(reader::Reader &reader, heap::Heap &heap, DecodeContext &context) const {
        engine_->Parse(reader, heap, context, *engine_);
    }
}
