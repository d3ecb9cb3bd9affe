#ifndef __heapgraph_test_tools_hprof_generator_h__
#define __heapgraph_test_tools_hprof_generator_h__

#include <cstdio>
#include <string>
#include <vector>

#include "buffer_generator.h"

namespace test::tools {

    namespace type {
        static constexpr uint8_t kObject = 2;
        static constexpr uint8_t kBoolean = 4;
        static constexpr uint8_t kChar = 5;
        static constexpr uint8_t kFloat = 6;
        static constexpr uint8_t kDouble = 7;
        static constexpr uint8_t kByte = 8;
        static constexpr uint8_t kShort = 9;
        static constexpr uint8_t kInt = 10;
        static constexpr uint8_t kLong = 11;
    }

    /**
     * Encoded size of \a type, references taking \a id_size bytes.
     */
    size_t type_size(uint8_t type, size_t id_size);

    struct field_spec_t {
        uint64_t name_id;
        uint8_t type;
    };

    struct static_field_spec_t {
        uint64_t name_id;
        uint8_t type;
        uint64_t value;
    };

    struct class_spec_t {
        uint64_t class_id;
        uint64_t super_class_id;
        uint32_t instance_size;
        std::vector<static_field_spec_t> static_fields;
        std::vector<field_spec_t> instance_fields;
    };

    /**
     * Builds the payload of a HEAP_DUMP or HEAP_DUMP_SEGMENT record.
     */
    class HeapContentGenerator {
    public:
        explicit HeapContentGenerator(size_t id_size);

        void AddRootUnknown(uint64_t object_id);

        void AddRootJniGlobal(uint64_t object_id, uint64_t global_ref_id);

        void AddRootJavaFrame(uint64_t object_id, uint32_t thread_serial, uint32_t frame_number);

        void AddRootThreadObject(uint64_t object_id, uint32_t thread_serial, uint32_t stack_trace_serial);

        void AddClass(const class_spec_t &spec);

        void AddInstance(uint64_t instance_id, uint64_t class_id, const std::string &fields_data);

        void AddObjectArray(uint64_t array_id, uint64_t array_class_id, const std::vector<uint64_t> &elements);

        void AddPrimitiveArray(uint64_t array_id, uint8_t type, uint32_t length, const std::string &data);

        /**
         * Direct access for malformed content.
         */
        BufferGenerator &Raw() {
            return buffer_;
        }

        [[nodiscard]] std::string GetContent() const {
            return buffer_.GetContent();
        }

    private:
        const size_t id_size_;
        BufferGenerator buffer_;
    };

    /**
     * Builds the field blob of an instance dump.
     */
    class FieldsGenerator {
    public:
        explicit FieldsGenerator(size_t id_size);

        FieldsGenerator &Add(uint8_t type, uint64_t value);

        [[nodiscard]] std::string GetContent() const {
            return buffer_.GetContent();
        }

    private:
        const size_t id_size_;
        BufferGenerator buffer_;
    };

    /**
     * Builds a whole HPROF file: header first, then records in call order.
     */
    class HprofGenerator {
    public:
        explicit HprofGenerator(size_t id_size, const std::string &version = "JAVA PROFILE 1.0.2");

        void AddRecord(uint8_t tag, const std::string &payload, uint32_t timestamp = 0);

        void AddString(uint64_t string_id, const std::string &value);

        void AddLoadClass(uint32_t class_serial, uint64_t class_id, uint64_t name_id);

        void AddHeapDump(const HeapContentGenerator &content);

        void AddHeapDumpSegment(const HeapContentGenerator &content);

        void AddHeapDumpEnd();

        [[nodiscard]] size_t GetIdSize() const {
            return id_size_;
        }

        [[nodiscard]] std::string GetContent() const {
            return buffer_.GetContent();
        }

    private:
        const size_t id_size_;
        BufferGenerator buffer_;
    };

    /**
     * Anonymous temporary file holding \a content, removed on destruction.
     */
    class TempFile {
    public:
        explicit TempFile(const std::string &content);

        ~TempFile();

        [[nodiscard]] int GetFd() const;

    private:
        FILE *file_;
    };
}

#endif
