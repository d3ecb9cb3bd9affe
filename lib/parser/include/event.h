#ifndef __heapgraph_event_h__
#define __heapgraph_event_h__

#include <functional>
#include <map>
#include <string>
#include <variant>

#include "errorha.h"
#include "hprof.h"
#include "object.h"

namespace heapgraph {

    /**
     * Emitted once for every top-level record with a known tag.
     */
    struct RecordCounted {
        record_tag_t tag;
        uint32_t timestamp;
        uint32_t length;
    };

    struct ClassResolved {
        ResolvedClass resolved;
    };

    struct ObjectResolved {
        ResolvedObject object;
    };

    /**
     * A recoverable failure. The offending record or object was dropped and decoding went on.
     */
    struct DecodeError {
        error_kind_t kind;
        std::string context;
    };

    typedef std::variant<RecordCounted, ClassResolved, ObjectResolved, DecodeError> event_t;

    typedef std::function<void(const event_t &)> event_handler_t;

    struct DecodeOptions {
        /**
         * When false only the top-level record stream is walked and nothing is buffered.
         */
        bool decode_objects = true;
        /**
         * When true each segment group starts with an empty class registry and object index.
         */
        bool isolate_groups = false;
        /**
         * When true references carry a description of the referent type.
         */
        bool describe_references = true;
    };

    struct DecodeSummary {
        size_t record_count = 0;
        size_t class_count = 0;
        size_t object_count = 0;
        size_t group_count = 0;
        std::map<error_kind_t, size_t> error_counts;

        [[nodiscard]] size_t GetErrorCount() const {
            size_t count = 0;
            for (const auto &[_, kind_count]: error_counts) count += kind_count;
            return count;
        }
    };
}

#endif
