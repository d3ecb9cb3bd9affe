#include "internal/engine.h"

#include <sstream>

#include "errorha.h"
#include "logger.h"
#include "record.h"
#include "resolver.h"

namespace heapgraph::internal::parser {

    namespace tag {
        static constexpr uint8_t kHeapRootUnknown = 0xff;
        static constexpr uint8_t kHeapRootJniGlobal = 0x01;
        static constexpr uint8_t kHeapRootJniLocal = 0x02;
        static constexpr uint8_t kHeapRootJavaFrame = 0x03;
        static constexpr uint8_t kHeapRootNativeStack = 0x04;
        static constexpr uint8_t kHeapRootStickyClass = 0x05;
        static constexpr uint8_t kHeapRootThreadBlock = 0x06;
        static constexpr uint8_t kHeapRootMonitorUsed = 0x07;
        static constexpr uint8_t kHeapRootThreadObject = 0x08;

        static constexpr uint8_t kHeapClassDump = 0x20;
        static constexpr uint8_t kHeapInstanceDump = 0x21;
        static constexpr uint8_t kHeapObjectArrayDump = 0x22;
        static constexpr uint8_t kHeapPrimitiveArrayDump = 0x23;
    }

    void HeapParserEngineImpl::Parse(reader::Reader &reader, heap::Heap &heap, DecodeContext &context,
                                     const HeapParserEngine &next) const {
        next.ParseHeader(reader, heap);

        const DecodeOptions &options = context.GetOptions();
        record::RecordStream stream(reader);
        std::optional<record::record_t> record;
        while ((record = stream.Next()).has_value()) {
            if (!record->tag.has_value()) {
                std::stringstream error_builder;
                error_builder << "unknown record tag " << static_cast<int>(record->raw_tag) << " at offset "
                              << record->offset << ", skipped " << record->length << " bytes";
                context.Report(error_kind_t::kUnknownTag, error_builder.str());
                continue;
            }
            const record_tag_t tag = record->tag.value();
            context.Emit(RecordCounted{
                    .tag = tag,
                    .timestamp = record->timestamp,
                    .length = record->length
            });
            if (!options.decode_objects) continue;

            switch (tag) {
                case record_tag_t::kUtf8:
                    context.Guard([&] { next.ParseStringRecord(record->payload, heap); });
                    break;
                case record_tag_t::kLoadClass:
                    next.ParseLoadClassRecord(record->payload, heap);
                    break;
                case record_tag_t::kHeapDump:
                case record_tag_t::kHeapDumpSegment:
                    if (!heap.IsGroupOpen()) heap.BeginGroup(options.isolate_groups);
                    next.ParseHeapContent(record->payload, heap, context, next);
                    break;
                case record_tag_t::kHeapDumpEnd:
                    if (heap.IsGroupOpen()) {
                        next.ResolveGroup(heap, context);
                    } else {
                        hgWarn("HEAP_DUMP_END at offset %zu closes no segment group", record->offset);
                    }
                    break;
                default:
                    break;
            }
        }
        if (heap.IsGroupOpen()) {
            hgWarn("segment group %zu is not closed by HEAP_DUMP_END", heap.GetGroupCount());
            next.ResolveGroup(heap, context);
        }
    }

    void HeapParserEngineImpl::ParseHeader(reader::Reader &reader, heap::Heap &heap) const {
        heap.SetHeader(record::read_header(reader));
    }

    void HeapParserEngineImpl::ParseStringRecord(reader::Reader &payload, heap::Heap &heap) const {
        const string_id_t string_id = payload.ReadId();
        const size_t length = payload.Remaining();
        heap.GetSymbols().AddString(string_id, payload.Extract(length), length);
    }

    void HeapParserEngineImpl::ParseLoadClassRecord(reader::Reader &payload, heap::Heap &heap) const {
        const symbol::load_class_t load_class{
                .class_serial = payload.ReadU4(),
                .class_id = payload.ReadId(),
                .stack_trace_serial = payload.ReadU4(),
                .name_id = payload.ReadId()
        };
        payload.ExpectConsumed("LOAD_CLASS record");
        heap.GetSymbols().AddLoadClass(load_class);
    }

    void HeapParserEngineImpl::ParseHeapContent(reader::Reader &payload, heap::Heap &heap, DecodeContext &context,
                                                const HeapParserEngine &next) const {
        while (!payload.IsEnd()) {
            const uint8_t tag = payload.ReadU1();
            const size_t begin = payload.GetCursor();
            size_t declared_size;
            switch (tag) {
                case tag::kHeapRootUnknown:
                    declared_size = next.ParseHeapContentRootUnknownSubRecord(payload, heap);
                    break;
                case tag::kHeapRootJniGlobal:
                    declared_size = next.ParseHeapContentRootJniGlobalSubRecord(payload, heap);
                    break;
                case tag::kHeapRootJniLocal:
                    declared_size = next.ParseHeapContentRootJniLocalSubRecord(payload, heap);
                    break;
                case tag::kHeapRootJavaFrame:
                    declared_size = next.ParseHeapContentRootJavaFrameSubRecord(payload, heap);
                    break;
                case tag::kHeapRootNativeStack:
                    declared_size = next.ParseHeapContentRootNativeStackSubRecord(payload, heap);
                    break;
                case tag::kHeapRootStickyClass:
                    declared_size = next.ParseHeapContentRootStickyClassSubRecord(payload, heap);
                    break;
                case tag::kHeapRootThreadBlock:
                    declared_size = next.ParseHeapContentRootThreadBlockSubRecord(payload, heap);
                    break;
                case tag::kHeapRootMonitorUsed:
                    declared_size = next.ParseHeapContentRootMonitorUsedSubRecord(payload, heap);
                    break;
                case tag::kHeapRootThreadObject:
                    declared_size = next.ParseHeapContentRootThreadObjectSubRecord(payload, heap);
                    break;
                case tag::kHeapClassDump:
                    declared_size = next.ParseHeapContentClassSubRecord(payload, heap, context);
                    break;
                case tag::kHeapInstanceDump:
                    declared_size = next.ParseHeapContentInstanceSubRecord(payload, heap);
                    break;
                case tag::kHeapObjectArrayDump:
                    declared_size = next.ParseHeapContentObjectArraySubRecord(payload, heap);
                    break;
                case tag::kHeapPrimitiveArrayDump:
                    declared_size = next.ParseHeapContentPrimitiveArraySubRecord(payload, heap);
                    break;
                default:
                    std::stringstream error_builder;
                    error_builder << "unsupported heap dump tag " << std::to_string(tag) << " at payload offset "
                                  << begin - sizeof(uint8_t);
                    fatal(error_kind_t::kUnknownSubRecord, error_builder.str());
            }
            const size_t consumed_size = payload.GetCursor() - begin;
            if (consumed_size != declared_size) {
                std::stringstream error_builder;
                error_builder << "heap dump sub-record " << std::to_string(tag) << " at payload offset "
                              << begin - sizeof(uint8_t) << " consumed " << consumed_size << " bytes, expected "
                              << declared_size;
                fatal(error_kind_t::kUnconsumedPayload, error_builder.str());
            }
        }
    }

    void HeapParserEngineImpl::ResolveGroup(heap::Heap &heap, DecodeContext &context) const {
        const std::vector<heap::handle_t> &pending = heap.GetPendingRecords();
        hgDebug("resolving %zu records of segment group %zu", pending.size(), heap.GetGroupCount());

        // Superclasses must all be known once the whole group is scanned.
        for (const auto handle: pending) {
            if (handle.kind != heap::record_kind_t::kClass) continue;
            const object_id_t class_id = heap.GetClassRecord(handle);
            const object_id_t super_class_id = unwrap(heap.GetClasses().FindDanglingSuperclass(class_id), continue);
            std::stringstream error_builder;
            error_builder << "superclass " << super_class_id << " of class " << class_id << " is not dumped";
            context.Report(error_kind_t::kDanglingSuperclass, error_builder.str());
        }

        const resolver::ObjectGraphResolver resolver(heap, context.GetOptions().describe_references);
        for (const auto handle: pending) {
            context.Guard([&] {
                if (handle.kind == heap::record_kind_t::kClass) {
                    context.Emit(ClassResolved{.resolved = resolver.ResolveClass(heap.GetClassRecord(handle))});
                } else {
                    context.Emit(ObjectResolved{.object = resolver.Resolve(handle)});
                }
            });
        }
        heap.EndGroup();
    }

    static gc_root_t make_gc_root(gc_root_type_t type, object_id_t object_id) {
        return gc_root_t{
                .type = type,
                .object_id = object_id,
                .jni_global_ref_id = kNullObjectId,
                .thread_serial = 0,
                .frame_number = 0,
                .stack_trace_serial = 0
        };
    }

    size_t
    HeapParserEngineImpl::ParseHeapContentRootUnknownSubRecord(reader::Reader &reader, heap::Heap &heap) const {
        heap.AddGcRoot(make_gc_root(gc_root_type_t::kRootUnknown, reader.ReadId()));
        return heap.GetIdSize();
    }

    size_t
    HeapParserEngineImpl::ParseHeapContentRootJniGlobalSubRecord(reader::Reader &reader, heap::Heap &heap) const {
        gc_root_t gc_root = make_gc_root(gc_root_type_t::kRootJniGlobal, reader.ReadId());
        gc_root.jni_global_ref_id = reader.ReadId();
        heap.AddGcRoot(gc_root);
        return heap.GetIdSize() + heap.GetIdSize();
    }

    size_t
    HeapParserEngineImpl::ParseHeapContentRootJniLocalSubRecord(reader::Reader &reader, heap::Heap &heap) const {
        gc_root_t gc_root = make_gc_root(gc_root_type_t::kRootJniLocal, reader.ReadId());
        gc_root.thread_serial = reader.ReadU4();
        gc_root.frame_number = reader.ReadU4();
        heap.AddGcRoot(gc_root);
        return heap.GetIdSize() + sizeof(uint32_t) + sizeof(uint32_t);
    }

    size_t
    HeapParserEngineImpl::ParseHeapContentRootJavaFrameSubRecord(reader::Reader &reader, heap::Heap &heap) const {
        gc_root_t gc_root = make_gc_root(gc_root_type_t::kRootJavaFrame, reader.ReadId());
        gc_root.thread_serial = reader.ReadU4();
        gc_root.frame_number = reader.ReadU4();
        heap.AddGcRoot(gc_root);
        return heap.GetIdSize() + sizeof(uint32_t) + sizeof(uint32_t);
    }

    size_t
    HeapParserEngineImpl::ParseHeapContentRootNativeStackSubRecord(reader::Reader &reader, heap::Heap &heap) const {
        gc_root_t gc_root = make_gc_root(gc_root_type_t::kRootNativeStack, reader.ReadId());
        gc_root.thread_serial = reader.ReadU4();
        heap.AddGcRoot(gc_root);
        return heap.GetIdSize() + sizeof(uint32_t);
    }

    size_t
    HeapParserEngineImpl::ParseHeapContentRootStickyClassSubRecord(reader::Reader &reader, heap::Heap &heap) const {
        heap.AddGcRoot(make_gc_root(gc_root_type_t::kRootStickyClass, reader.ReadId()));
        return heap.GetIdSize();
    }

    size_t
    HeapParserEngineImpl::ParseHeapContentRootThreadBlockSubRecord(reader::Reader &reader, heap::Heap &heap) const {
        gc_root_t gc_root = make_gc_root(gc_root_type_t::kRootThreadBlock, reader.ReadId());
        gc_root.thread_serial = reader.ReadU4();
        heap.AddGcRoot(gc_root);
        return heap.GetIdSize() + sizeof(uint32_t);
    }

    size_t
    HeapParserEngineImpl::ParseHeapContentRootMonitorUsedSubRecord(reader::Reader &reader, heap::Heap &heap) const {
        heap.AddGcRoot(make_gc_root(gc_root_type_t::kRootMonitorUsed, reader.ReadId()));
        return heap.GetIdSize();
    }

    size_t
    HeapParserEngineImpl::ParseHeapContentRootThreadObjectSubRecord(reader::Reader &reader, heap::Heap &heap) const {
        gc_root_t gc_root = make_gc_root(gc_root_type_t::kRootThreadObject, reader.ReadId());
        gc_root.thread_serial = reader.ReadU4();
        gc_root.stack_trace_serial = reader.ReadU4();
        heap.AddGcRoot(gc_root);
        return heap.GetIdSize() + sizeof(uint32_t) + sizeof(uint32_t);
    }

    size_t
    HeapParserEngineImpl::ParseHeapContentClassSubRecord(reader::Reader &reader, heap::Heap &heap,
                                                         DecodeContext &context) const {
        const size_t id_size = heap.GetIdSize();
        registry::class_def_t class_def{
                .class_id = reader.ReadId(),
                .stack_trace_serial = reader.ReadU4(),
                .super_class_id = reader.ReadId(),
                .class_loader_id = reader.ReadId(),
                .signers_id = reader.ReadId(),
                .protection_domain_id = reader.ReadId(),
                .instance_size = 0,
                .constant_pool = {},
                .static_fields = {},
                .instance_fields = {}
        };
        reader.SkipId(); // Skip reserved space.
        reader.SkipId(); // Skip reserved space.
        class_def.instance_size = reader.ReadU4();

        size_t content_size = 0;

        const size_t constant_pool_length = reader.ReadU2();
        content_size += sizeof(uint16_t);
        for (size_t i = 0; i < constant_pool_length; ++i) {
            const uint16_t index = reader.ReadU2();
            const value_type_t type = value_type_cast(reader.ReadU1());
            class_def.constant_pool.emplace_back(registry::constant_t{
                    .index = index,
                    .value = heap::read_value(reader, type)
            });
            content_size += sizeof(uint16_t) + sizeof(uint8_t) + get_value_type_size(type, id_size);
        }

        const size_t static_fields_length = reader.ReadU2();
        content_size += sizeof(uint16_t);
        for (size_t i = 0; i < static_fields_length; ++i) {
            const string_id_t name_id = reader.ReadId();
            const value_type_t type = value_type_cast(reader.ReadU1());
            class_def.static_fields.emplace_back(registry::static_field_t{
                    .name_id = name_id,
                    .value = heap::read_value(reader, type)
            });
            content_size += id_size + sizeof(uint8_t) + get_value_type_size(type, id_size);
        }

        const size_t instance_fields_length = reader.ReadU2();
        content_size += sizeof(uint16_t);
        for (size_t i = 0; i < instance_fields_length; ++i) {
            const string_id_t name_id = reader.ReadId();
            const value_type_t type = value_type_cast(reader.ReadU1());
            class_def.instance_fields.emplace_back(registry::field_t{.name_id = name_id, .type = type});
            content_size += id_size + sizeof(uint8_t);
        }

        const object_id_t class_id = class_def.class_id;
        if (context.Guard([&] { heap.GetClasses().Register(std::move(class_def)); })) {
            heap.AddClass(class_id);
        }

        return id_size + sizeof(uint32_t) + (id_size * 6) + sizeof(uint32_t) + content_size;
    }

    size_t
    HeapParserEngineImpl::ParseHeapContentInstanceSubRecord(reader::Reader &reader, heap::Heap &heap) const {
        const object_id_t instance_id = reader.ReadId();
        const uint32_t stack_trace_serial = reader.ReadU4();
        const object_id_t class_id = reader.ReadId();
        const size_t fields_data_size = reader.ReadU4();
        heap.AddInstance(heap::instance_record_t{
                .id = instance_id,
                .stack_trace_serial = stack_trace_serial,
                .class_id = class_id,
                .data = reader.Extract(fields_data_size),
                .data_size = fields_data_size
        });
        return heap.GetIdSize() + sizeof(uint32_t) + heap.GetIdSize() + sizeof(uint32_t) + fields_data_size;
    }

    size_t
    HeapParserEngineImpl::ParseHeapContentObjectArraySubRecord(reader::Reader &reader, heap::Heap &heap) const {
        const object_id_t array_id = reader.ReadId();
        const uint32_t stack_trace_serial = reader.ReadU4();
        const uint32_t length = reader.ReadU4();
        const object_id_t array_class_id = reader.ReadId();
        const size_t elements_size = static_cast<size_t>(length) * heap.GetIdSize();
        heap.AddObjectArray(heap::object_array_record_t{
                .id = array_id,
                .stack_trace_serial = stack_trace_serial,
                .array_class_id = array_class_id,
                .length = length,
                .data = reader.Extract(elements_size)
        });
        return heap.GetIdSize() + sizeof(uint32_t) + sizeof(uint32_t) + heap.GetIdSize() + elements_size;
    }

    size_t
    HeapParserEngineImpl::ParseHeapContentPrimitiveArraySubRecord(reader::Reader &reader, heap::Heap &heap) const {
        const object_id_t array_id = reader.ReadId();
        const uint32_t stack_trace_serial = reader.ReadU4();
        const uint32_t length = reader.ReadU4();
        const value_type_t type = value_type_cast(reader.ReadU1());
        if (type == value_type_t::kObject) {
            std::stringstream error_builder;
            error_builder << "primitive array " << array_id << " declares object elements";
            fatal(error_kind_t::kInvalidValueType, error_builder.str());
        }
        const size_t elements_size = static_cast<size_t>(length) * get_value_type_size(type, heap.GetIdSize());
        heap.AddPrimitiveArray(heap::primitive_array_record_t{
                .id = array_id,
                .stack_trace_serial = stack_trace_serial,
                .element_type = type,
                .length = length,
                .data = reader.Extract(elements_size)
        });
        return heap.GetIdSize() + sizeof(uint32_t) + sizeof(uint32_t) + sizeof(uint8_t) + elements_size;
    }
}
