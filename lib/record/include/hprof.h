#ifndef __heapgraph_hprof_h__
#define __heapgraph_hprof_h__

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace heapgraph {

    /**
     * Top-level record tags of a HotSpot HPROF file.
     */
    enum class record_tag_t : uint8_t {
        kUtf8 = 0x01,
        kLoadClass = 0x02,
        kUnloadClass = 0x03,
        kStackFrame = 0x04,
        kStackTrace = 0x05,
        kAllocSites = 0x06,
        kHeapSummary = 0x07,
        kStartThread = 0x0a,
        kEndThread = 0x0b,
        kHeapDump = 0x0c,
        kCpuSamples = 0x0d,
        kControlSettings = 0x0e,
        kHeapDumpSegment = 0x1c,
        kHeapDumpEnd = 0x2c,
    };

    static constexpr record_tag_t kRecordTags[] = {
            record_tag_t::kUtf8,
            record_tag_t::kLoadClass,
            record_tag_t::kUnloadClass,
            record_tag_t::kStackFrame,
            record_tag_t::kStackTrace,
            record_tag_t::kAllocSites,
            record_tag_t::kHeapSummary,
            record_tag_t::kStartThread,
            record_tag_t::kEndThread,
            record_tag_t::kHeapDump,
            record_tag_t::kHeapDumpSegment,
            record_tag_t::kHeapDumpEnd,
            record_tag_t::kCpuSamples,
            record_tag_t::kControlSettings,
    };

    /**
     * Returns std::nullopt if \a tag is not one of the known top-level tags.
     */
    std::optional<record_tag_t> record_tag_cast(uint8_t tag);

    [[nodiscard]] const char *record_tag_name(record_tag_t tag);

    struct hprof_header_t {
        std::string version;
        size_t id_size;
        uint64_t timestamp_ms;
    };
}

#endif
