#include "engine.h"
#include "gtest/gtest.h"

#include "buffer_generator.h"
#include "hprof_generator.h"

#include "mock/mock_engine.h"

#include "errorha.h"

using namespace heapgraph;
using namespace heapgraph::internal::heap;
using namespace heapgraph::internal::parser;
using namespace heapgraph::internal::reader;

using namespace test::tools;
using namespace test::mock;

using namespace testing;

typedef uint32_t identifier_t;

static constexpr size_t kRecordSize = (1 << 5) - 1;

static Reader make_reader(const std::string &buffer) {
    return {reinterpret_cast<const uint8_t *>(buffer.data()), buffer.size(), sizeof(identifier_t)};
}

static void initialize_heap(Heap &heap) {
    heap.SetHeader(hprof_header_t{
            .version = "JAVA PROFILE 1.0.2",
            .id_size = sizeof(identifier_t),
            .timestamp_ms = 0
    });
}

TEST(parser_engine, main) {
    HeapParserEngineImpl engine;
    Heap heap_unused;
    DecodeContext context(DecodeOptions(), nullptr);

    NiceMock<MockEngine> mock_engine(sizeof(identifier_t));

    const size_t string_records_count = 5;
    const size_t heap_content_records_count = 5;
    const std::string buffer = ({
        BufferGenerator generator;
        // Header.
        {
            generator.WriteNullTerminatedString("Version String");
            generator.Write<uint32_t>(sizeof(identifier_t));
            generator.WriteZero(sizeof(uint64_t));
        }
        // Strings.
        {
            for (size_t i = 0; i < string_records_count; ++i) {
                generator.Write<uint8_t>(0x01);
                generator.WriteZero(sizeof(uint32_t));
                generator.Write<uint32_t>(kRecordSize);
                generator.WriteZero(kRecordSize);
            }
        }
        // Load classes.
        {
            generator.Write<uint8_t>(0x02);
            generator.WriteZero(sizeof(uint32_t));
            generator.Write<uint32_t>(kRecordSize);
            generator.WriteZero(kRecordSize);
        }
        // Heap content.
        {
            for (size_t i = 0; i < heap_content_records_count; ++i) {
                const uint8_t tag = (i & 1) == 0 ? 0x0c : 0x1c;
                generator.Write<uint8_t>(tag);
                generator.WriteZero(sizeof(uint32_t));
                generator.Write<uint32_t>(kRecordSize);
                generator.WriteZero(kRecordSize);
            }
        }
        // Unknown.
        {
            generator.Write<uint8_t>(0x99);
            generator.WriteZero(sizeof(uint32_t));
            generator.Write<uint32_t>(kRecordSize);
            generator.WriteZero(kRecordSize);
        }
        // Known but ignored.
        {
            generator.Write<uint8_t>(0x05);
            generator.WriteZero(sizeof(uint32_t));
            generator.Write<uint32_t>(kRecordSize);
            generator.WriteZero(kRecordSize);
        }
        // End.
        {
            generator.Write<uint8_t>(0x2c);
            generator.WriteZero(sizeof(uint32_t));
            generator.Write<uint32_t>(0);
        }
        generator.GetContent();
    });

    Reader reader(reinterpret_cast<const uint8_t *>(buffer.data()), buffer.size());

    EXPECT_CALL(mock_engine, ParseHeader(_, _));
    EXPECT_CALL(mock_engine, ParseStringRecord(_, _))
            .Times(string_records_count);
    EXPECT_CALL(mock_engine, ParseLoadClassRecord(_, _));
    EXPECT_CALL(mock_engine, ParseHeapContent(_, _, _, _))
            .Times(heap_content_records_count);
    EXPECT_CALL(mock_engine, ResolveGroup(_, _));

    engine.Parse(reader, heap_unused, context, mock_engine);

    EXPECT_EQ(string_records_count + 1 + heap_content_records_count + 2, context.GetSummary().record_count);
    EXPECT_EQ(1, context.GetSummary().error_counts.at(error_kind_t::kUnknownTag));
    EXPECT_EQ(1, heap_unused.GetGroupCount());
}

TEST(parser_engine, count_only) {
    HeapParserEngineImpl engine;
    Heap heap_unused;
    DecodeContext context(DecodeOptions{.decode_objects = false}, nullptr);

    NiceMock<MockEngine> mock_engine(sizeof(identifier_t));

    HprofGenerator generator(sizeof(identifier_t));
    generator.AddString(0x101, "unused");
    generator.AddHeapDumpSegment(HeapContentGenerator(sizeof(identifier_t)));
    generator.AddHeapDumpEnd();
    const std::string buffer = generator.GetContent();
    Reader reader(reinterpret_cast<const uint8_t *>(buffer.data()), buffer.size());

    EXPECT_CALL(mock_engine, ParseStringRecord(_, _)).Times(0);
    EXPECT_CALL(mock_engine, ParseHeapContent(_, _, _, _)).Times(0);
    EXPECT_CALL(mock_engine, ResolveGroup(_, _)).Times(0);

    engine.Parse(reader, heap_unused, context, mock_engine);
    EXPECT_EQ(3, context.GetSummary().record_count);
}

TEST(parser_engine, unterminated_group) {
    HeapParserEngineImpl engine;
    Heap heap_unused;
    DecodeContext context(DecodeOptions(), nullptr);

    NiceMock<MockEngine> mock_engine(sizeof(identifier_t));

    HprofGenerator generator(sizeof(identifier_t));
    generator.AddHeapDumpSegment(HeapContentGenerator(sizeof(identifier_t)));
    generator.AddHeapDumpSegment(HeapContentGenerator(sizeof(identifier_t)));
    const std::string buffer = generator.GetContent();
    Reader reader(reinterpret_cast<const uint8_t *>(buffer.data()), buffer.size());

    EXPECT_CALL(mock_engine, ParseHeapContent(_, _, _, _)).Times(2);
    EXPECT_CALL(mock_engine, ResolveGroup(_, _));

    engine.Parse(reader, heap_unused, context, mock_engine);
    EXPECT_FALSE(heap_unused.IsGroupOpen());
}

TEST(parser_engine, header) {
    HeapParserEngineImpl engine;
    {
        const std::string buffer = ({
            BufferGenerator generator;
            generator.WriteNullTerminatedString("JAVA PROFILE 1.0");
            generator.Write<uint32_t>(4);
            generator.Write<uint64_t>(1234);
            generator.GetContent();
        });
        Reader reader(reinterpret_cast<const uint8_t *>(buffer.data()), buffer.size());
        Heap heap;
        EXPECT_NO_THROW(engine.ParseHeader(reader, heap));
        EXPECT_EQ(heap.GetIdSize(), 4);
        EXPECT_EQ(heap.GetHeader().timestamp_ms, 1234);
    }
    {
        const std::string buffer = ({
            BufferGenerator generator;
            generator.WriteNullTerminatedString("JAVA PROFILE 1.0.2");
            generator.Write<uint32_t>(8);
            generator.WriteZero(sizeof(uint64_t));
            generator.GetContent();
        });
        Reader reader(reinterpret_cast<const uint8_t *>(buffer.data()), buffer.size());
        Heap heap;
        EXPECT_NO_THROW(engine.ParseHeader(reader, heap));
        EXPECT_EQ(heap.GetIdSize(), 8);
        EXPECT_EQ(heap.GetHeader().version, "JAVA PROFILE 1.0.2");
    }
    {
        const std::string buffer = ({
            BufferGenerator generator;
            generator.WriteNullTerminatedString("JAVA PROFILE 1.0.2");
            generator.Write<uint32_t>(5);
            generator.WriteZero(sizeof(uint64_t));
            generator.GetContent();
        });
        Reader reader(reinterpret_cast<const uint8_t *>(buffer.data()), buffer.size());
        Heap heap;
        EXPECT_THROW(engine.ParseHeader(reader, heap), HprofError);
    }
}

TEST(parser_engine, strings) {
    HeapParserEngineImpl engine;
    const std::string buffer = ({
        BufferGenerator generator;
        generator.Write<identifier_t>(0x101);
        generator.WriteString("Hello world!");
        generator.GetContent();
    });

    Heap heap;
    initialize_heap(heap);
    Reader reader = make_reader(buffer);
    engine.ParseStringRecord(reader, heap);
    EXPECT_EQ("Hello world!", heap.GetSymbols().GetString(0x101));
}

TEST(parser_engine, load_class) {
    HeapParserEngineImpl engine;
    const std::string buffer = ({
        BufferGenerator generator;
        generator.WriteZero(sizeof(uint32_t));
        generator.Write<identifier_t>(0x001);
        generator.WriteZero(sizeof(uint32_t));
        generator.Write<identifier_t>(0x101);
        generator.GetContent();
    });
    Heap heap;
    initialize_heap(heap);
    Reader reader = make_reader(buffer);
    engine.ParseLoadClassRecord(reader, heap);
    EXPECT_EQ(0x101, heap.GetSymbols().GetLoadClass(0x001)->name_id);
}

TEST(parser_engine, heap_content) {
    const std::string buffer = ({
        BufferGenerator generator;
        // root unknown
        generator.Write<uint8_t>(0xff);
        generator.WriteZero(sizeof(identifier_t));
        // root Jni global
        generator.Write<uint8_t>(0x01);
        generator.WriteZero(sizeof(identifier_t) + sizeof(identifier_t));
        // root Jni local
        generator.Write<uint8_t>(0x02);
        generator.WriteZero(sizeof(identifier_t) + sizeof(uint32_t) + sizeof(uint32_t));
        // root Java frame
        generator.Write<uint8_t>(0x03);
        generator.WriteZero(sizeof(identifier_t) + sizeof(uint32_t) + sizeof(uint32_t));
        // root native stack
        generator.Write<uint8_t>(0x04);
        generator.WriteZero(sizeof(identifier_t) + sizeof(uint32_t));
        // root sticky class
        generator.Write<uint8_t>(0x05);
        generator.WriteZero(sizeof(identifier_t));
        // root thread block
        generator.Write<uint8_t>(0x06);
        generator.WriteZero(sizeof(identifier_t) + sizeof(uint32_t));
        // root monitor used
        generator.Write<uint8_t>(0x07);
        generator.WriteZero(sizeof(identifier_t));
        // root thread object
        generator.Write<uint8_t>(0x08);
        generator.WriteZero(sizeof(identifier_t) + sizeof(uint32_t) + sizeof(uint32_t));
        // class
        generator.Write<uint8_t>(0x20);
        generator.WriteZero(sizeof(identifier_t) + sizeof(uint32_t) + sizeof(identifier_t) * 6
                            + sizeof(uint32_t) + sizeof(uint16_t) * 3);
        // instance
        generator.Write<uint8_t>(0x21);
        generator.WriteZero(sizeof(identifier_t) + sizeof(uint32_t) + sizeof(identifier_t) + sizeof(uint32_t));
        // object array
        generator.Write<uint8_t>(0x22);
        generator.WriteZero(sizeof(identifier_t) + sizeof(uint32_t) + sizeof(uint32_t) + sizeof(identifier_t));
        // primitive array
        generator.Write<uint8_t>(0x23);
        generator.WriteZero(sizeof(identifier_t) + sizeof(uint32_t) + sizeof(uint32_t));
        generator.Write<uint8_t>(static_cast<uint8_t>(value_type_t::kByte));

        generator.GetContent();
    });
    Heap heap;
    initialize_heap(heap);
    DecodeContext context(DecodeOptions(), nullptr);

    Reader reader = make_reader(buffer);

    HeapParserEngineImpl engine;
    MockEngine mock_engine(sizeof(identifier_t));

    EXPECT_CALL(mock_engine, ParseHeapContentRootUnknownSubRecord(_, _));
    EXPECT_CALL(mock_engine, ParseHeapContentRootJniGlobalSubRecord(_, _));
    EXPECT_CALL(mock_engine, ParseHeapContentRootJniLocalSubRecord(_, _));
    EXPECT_CALL(mock_engine, ParseHeapContentRootJavaFrameSubRecord(_, _));
    EXPECT_CALL(mock_engine, ParseHeapContentRootNativeStackSubRecord(_, _));
    EXPECT_CALL(mock_engine, ParseHeapContentRootStickyClassSubRecord(_, _));
    EXPECT_CALL(mock_engine, ParseHeapContentRootThreadBlockSubRecord(_, _));
    EXPECT_CALL(mock_engine, ParseHeapContentRootMonitorUsedSubRecord(_, _));
    EXPECT_CALL(mock_engine, ParseHeapContentRootThreadObjectSubRecord(_, _));
    EXPECT_CALL(mock_engine, ParseHeapContentClassSubRecord(_, _, _));
    EXPECT_CALL(mock_engine, ParseHeapContentInstanceSubRecord(_, _));
    EXPECT_CALL(mock_engine, ParseHeapContentObjectArraySubRecord(_, _));
    EXPECT_CALL(mock_engine, ParseHeapContentPrimitiveArraySubRecord(_, _));

    engine.ParseHeapContent(reader, heap, context, mock_engine);
    EXPECT_TRUE(reader.IsEnd());
}

TEST(parser_engine, heap_content_unknown_sub_record) {
    const std::string buffer = ({
        BufferGenerator generator;
        generator.Write<uint8_t>(0x89);
        generator.WriteZero(sizeof(identifier_t));
        generator.GetContent();
    });
    Heap heap;
    initialize_heap(heap);
    DecodeContext context(DecodeOptions(), nullptr);
    Reader reader = make_reader(buffer);

    HeapParserEngineImpl engine;
    try {
        engine.ParseHeapContent(reader, heap, context, engine);
        FAIL() << "unknown sub-record accepted";
    } catch (const HprofError &error) {
        EXPECT_EQ(error_kind_t::kUnknownSubRecord, error.GetKind());
    }
}

TEST(parser_engine, heap_content_size_mismatch) {
    const std::string buffer = ({
        BufferGenerator generator;
        generator.Write<uint8_t>(0xff);
        generator.WriteZero(sizeof(identifier_t));
        generator.GetContent();
    });
    Heap heap;
    initialize_heap(heap);
    DecodeContext context(DecodeOptions(), nullptr);
    Reader reader = make_reader(buffer);

    HeapParserEngineImpl engine;
    NiceMock<MockEngine> mock_engine(sizeof(identifier_t));
    ON_CALL(mock_engine, ParseHeapContentRootUnknownSubRecord(_, _))
            .WillByDefault(
                    [](Reader &reader, Heap &) {
                        reader.SkipId();
                        return sizeof(identifier_t) + 1;
                    }
            );
    try {
        engine.ParseHeapContent(reader, heap, context, mock_engine);
        FAIL() << "sub-record size mismatch accepted";
    } catch (const HprofError &error) {
        EXPECT_EQ(error_kind_t::kUnconsumedPayload, error.GetKind());
    }
}

TEST(parser_engine, roots) {
    HeapContentGenerator generator(sizeof(identifier_t));
    generator.AddRootJniGlobal(0x001, 0x201);
    generator.AddRootJavaFrame(0x002, 7, 3);
    generator.AddRootThreadObject(0x003, 1, 9);
    const std::string buffer = generator.GetContent();

    Heap heap;
    initialize_heap(heap);
    DecodeContext context(DecodeOptions(), nullptr);
    Reader reader = make_reader(buffer);

    HeapParserEngineImpl engine;
    engine.ParseHeapContent(reader, heap, context, engine);

    const auto &roots = heap.GetGcRoots();
    ASSERT_EQ(3, roots.size());
    EXPECT_EQ(gc_root_type_t::kRootJniGlobal, roots[0].type);
    EXPECT_EQ(0x001, roots[0].object_id);
    EXPECT_EQ(0x201, roots[0].jni_global_ref_id);
    EXPECT_EQ(gc_root_type_t::kRootJavaFrame, roots[1].type);
    EXPECT_EQ(7, roots[1].thread_serial);
    EXPECT_EQ(3, roots[1].frame_number);
    EXPECT_EQ(gc_root_type_t::kRootThreadObject, roots[2].type);
    EXPECT_EQ(9, roots[2].stack_trace_serial);
}

TEST(parser_engine, class_and_instance) {
    HeapContentGenerator generator(sizeof(identifier_t));
    generator.AddClass(class_spec_t{
            .class_id = 0x011,
            .super_class_id = 0,
            .instance_size = 4,
            .static_fields = {{.name_id = 0x102, .type = type::kLong, .value = 5}},
            .instance_fields = {{.name_id = 0x101, .type = type::kInt}}
    });
    generator.AddInstance(0x001, 0x011, FieldsGenerator(sizeof(identifier_t)).Add(type::kInt, 42).GetContent());
    generator.AddPrimitiveArray(0x002, type::kShort, 2, std::string("\x00\x01\x00\x02", 4));
    const std::string buffer = generator.GetContent();

    Heap heap;
    initialize_heap(heap);
    heap.BeginGroup(false);
    DecodeContext context(DecodeOptions(), nullptr);
    Reader reader = make_reader(buffer);

    HeapParserEngineImpl engine;
    engine.ParseHeapContent(reader, heap, context, engine);

    const auto *class_def = heap.GetClasses().Lookup(0x011);
    ASSERT_NE(nullptr, class_def);
    ASSERT_EQ(1, class_def->static_fields.size());
    EXPECT_EQ(5, class_def->static_fields[0].value.AsLong());
    ASSERT_EQ(1, class_def->instance_fields.size());
    EXPECT_EQ(value_type_t::kInt, class_def->instance_fields[0].type);

    ASSERT_EQ(3, heap.GetPendingRecords().size());
    EXPECT_EQ(record_kind_t::kClass, heap.GetPendingRecords()[0].kind);
    const auto handle = heap.FindObject(0x001);
    ASSERT_TRUE(handle.has_value());
    EXPECT_EQ(0x011, heap.GetInstance(handle.value()).class_id);
    EXPECT_EQ(4, heap.GetInstance(handle.value()).data_size);
    EXPECT_EQ(2, heap.GetPrimitiveArray(heap.FindObject(0x002).value()).length);
}

TEST(parser_engine, duplicate_class) {
    HeapContentGenerator generator(sizeof(identifier_t));
    const class_spec_t spec{.class_id = 0x011, .super_class_id = 0, .instance_size = 0};
    generator.AddClass(spec);
    generator.AddClass(spec);
    const std::string buffer = generator.GetContent();

    Heap heap;
    initialize_heap(heap);
    heap.BeginGroup(false);
    DecodeContext context(DecodeOptions(), nullptr);
    Reader reader = make_reader(buffer);

    HeapParserEngineImpl engine;
    engine.ParseHeapContent(reader, heap, context, engine);

    EXPECT_EQ(1, heap.GetClasses().GetClassCount());
    EXPECT_EQ(1, heap.GetPendingRecords().size());
    EXPECT_EQ(1, context.GetSummary().error_counts.at(error_kind_t::kDuplicateClassDef));
}

TEST(parser_engine, primitive_array_of_objects) {
    HeapContentGenerator generator(sizeof(identifier_t));
    generator.AddPrimitiveArray(0x002, type::kObject, 0, "");
    const std::string buffer = generator.GetContent();

    Heap heap;
    initialize_heap(heap);
    DecodeContext context(DecodeOptions(), nullptr);
    Reader reader = make_reader(buffer);

    HeapParserEngineImpl engine;
    EXPECT_THROW(engine.ParseHeapContent(reader, heap, context, engine), HprofError);
}

TEST(parser_engine, resolve_group) {
    Heap heap;
    initialize_heap(heap);
    heap.BeginGroup(false);
    {
        HeapContentGenerator generator(sizeof(identifier_t));
        generator.AddClass(class_spec_t{.class_id = 0x011, .super_class_id = 0x099, .instance_size = 0});
        generator.AddInstance(0x001, 0x011, "");
        generator.AddInstance(0x002, 0x012, "");
        generator.AddObjectArray(0x003, 0x013, {0x001, 0});
        const std::string buffer = generator.GetContent();
        DecodeContext context(DecodeOptions(), nullptr);
        Reader reader = make_reader(buffer);
        HeapParserEngineImpl engine;
        engine.ParseHeapContent(reader, heap, context, engine);

        std::vector<event_t> events;
        DecodeContext resolve_context(DecodeOptions(), [&](const event_t &event) { events.push_back(event); });
        engine.ResolveGroup(heap, resolve_context);

        // Dangling superclass once for the class, once more for its instance; unknown class for 0x002.
        const auto &summary = resolve_context.GetSummary();
        EXPECT_EQ(2, summary.error_counts.at(error_kind_t::kDanglingSuperclass));
        EXPECT_EQ(1, summary.error_counts.at(error_kind_t::kUnknownClass));
        EXPECT_EQ(1, summary.class_count);
        EXPECT_EQ(1, summary.object_count);
        EXPECT_FALSE(heap.IsGroupOpen());

        const auto &array = std::get<ObjectResolved>(events.back()).object;
        EXPECT_EQ(object_kind_t::kObjectArray, array.kind);
        EXPECT_EQ(0x003, array.id);
        ASSERT_EQ(2, array.references.size());
        EXPECT_EQ(0x001, array.references[0].id);
        EXPECT_TRUE(array.references[1].IsNull());
    }
}
