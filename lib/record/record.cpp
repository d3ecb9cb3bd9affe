#include "include/record.h"

#include <sstream>

#include "errorha.h"
#include "logger.h"

namespace heapgraph {

    std::optional<record_tag_t> record_tag_cast(uint8_t tag) {
        for (const auto known: kRecordTags) {
            if (static_cast<uint8_t>(known) == tag) return known;
        }
        return std::nullopt;
    }

    const char *record_tag_name(record_tag_t tag) {
        switch (tag) {
            case record_tag_t::kUtf8:
                return "Utf8";
            case record_tag_t::kLoadClass:
                return "LoadClass";
            case record_tag_t::kUnloadClass:
                return "UnloadClass";
            case record_tag_t::kStackFrame:
                return "StackFrame";
            case record_tag_t::kStackTrace:
                return "StackTrace";
            case record_tag_t::kAllocSites:
                return "AllocSites";
            case record_tag_t::kHeapSummary:
                return "HeapSummary";
            case record_tag_t::kStartThread:
                return "StartThread";
            case record_tag_t::kEndThread:
                return "EndThread";
            case record_tag_t::kHeapDump:
                return "HeapDump";
            case record_tag_t::kCpuSamples:
                return "CpuSamples";
            case record_tag_t::kControlSettings:
                return "ControlSettings";
            case record_tag_t::kHeapDumpSegment:
                return "HeapDumpSegment";
            case record_tag_t::kHeapDumpEnd:
                return "HeapDumpEnd";
        }
        return "Unknown";
    }
}

namespace heapgraph::internal::record {

    hprof_header_t read_header(reader::Reader &reader) {
        const std::string version = reader.ReadNullTerminatedString();
        if (version != "JAVA PROFILE 1.0" &&
            version != "JAVA PROFILE 1.0.1" &&
            version != "JAVA PROFILE 1.0.2" &&
            version != "JAVA PROFILE 1.0.3") {
            fatal(error_kind_t::kInvalidHeader, "invalid HPROF header \"" + version + "\"");
        }
        const uint32_t id_size = reader.ReadU4();
        if (id_size != sizeof(uint32_t) && id_size != sizeof(uint64_t)) {
            fatal(error_kind_t::kInvalidHeader, "unsupported identifier size " + std::to_string(id_size));
        }
        reader.SetIdSize(id_size);
        const uint64_t timestamp = reader.ReadU8();
        hgInfo("%s, identifier size %u, timestamp %llu", version.c_str(), id_size,
               static_cast<unsigned long long>(timestamp));
        return hprof_header_t{
                .version = version,
                .id_size = id_size,
                .timestamp_ms = timestamp
        };
    }

    RecordStream::RecordStream(reader::Reader &reader) :
            reader_(reader),
            start_(reader.GetCursor()) {}

    std::optional<record_t> RecordStream::Next() {
        if (reader_.IsEnd()) return std::nullopt;
        const size_t offset = reader_.GetCursor();
        const uint8_t tag = reader_.ReadU1();
        const uint32_t timestamp = reader_.ReadU4();
        const uint32_t length = reader_.ReadU4();
        if (length > reader_.Remaining()) {
            std::stringstream error_builder;
            error_builder << "record at offset " << offset << " declares " << length << " bytes, "
                          << reader_.Remaining() << " left";
            fatal(error_kind_t::kTruncatedInput, error_builder.str());
        }
        return record_t{
                .raw_tag = tag,
                .tag = record_tag_cast(tag),
                .timestamp = timestamp,
                .length = length,
                .offset = offset,
                .payload = reader_.Slice(length)
        };
    }

    void RecordStream::Rewind() {
        reader_.ResetCursor();
        reader_.Skip(start_);
    }
}
