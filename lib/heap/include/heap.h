#ifndef __heapgraph_heap_h__
#define __heapgraph_heap_h__

#include <optional>
#include <unordered_map>
#include <vector>

#include "hprof.h"
#include "object.h"
#include "reader.h"
#include "registry.h"
#include "symbol.h"
#include "value.h"

namespace heapgraph::internal::heap {

    /**
     * Reads one value of \a type. Object references use the identifier size of \a reader.
     */
    Value read_value(reader::Reader &reader, value_type_t type);

    enum class record_kind_t : uint8_t {
        kClass,
        kInstance,
        kObjectArray,
        kPrimitiveArray,
    };

    /**
     * Index of a buffered record in the arena of its kind.
     */
    struct handle_t {
        record_kind_t kind;
        uint32_t index;
    };

    struct instance_record_t {
        object_id_t id;
        uint32_t stack_trace_serial;
        object_id_t class_id;
        const uint8_t *data;
        size_t data_size;
    };

    struct object_array_record_t {
        object_id_t id;
        uint32_t stack_trace_serial;
        object_id_t array_class_id;
        uint32_t length;
        const uint8_t *data;
    };

    struct primitive_array_record_t {
        object_id_t id;
        uint32_t stack_trace_serial;
        value_type_t element_type;
        uint32_t length;
        const uint8_t *data;
    };

    /**
     * Everything collected from one HPROF file.
     * <p>
     * Instance and array records buffered during the first pass over a segment group keep pointers into the mapped
     * file rather than copies of their payloads. Records are addressed by small handles and indexed by object id, so
     * any of them can be resolved again later, one at a time.
     */
    class Heap {
    public:
        void SetHeader(const hprof_header_t &header);

        [[nodiscard]] const hprof_header_t &GetHeader() const;

        [[nodiscard]] size_t GetIdSize() const;

        symbol::SymbolTable &GetSymbols() {
            return symbols_;
        }

        [[nodiscard]] const symbol::SymbolTable &GetSymbols() const {
            return symbols_;
        }

        registry::ClassRegistry &GetClasses() {
            return classes_;
        }

        [[nodiscard]] const registry::ClassRegistry &GetClasses() const {
            return classes_;
        }

        void AddGcRoot(const gc_root_t &gc_root);

        [[nodiscard]] const std::vector<gc_root_t> &GetGcRoots() const {
            return gc_roots_;
        }

        handle_t AddClass(object_id_t class_id);

        handle_t AddInstance(const instance_record_t &record);

        handle_t AddObjectArray(const object_array_record_t &record);

        handle_t AddPrimitiveArray(const primitive_array_record_t &record);

        [[nodiscard]] std::optional<handle_t> FindObject(object_id_t object_id) const;

        [[nodiscard]] object_id_t GetClassRecord(handle_t handle) const;

        [[nodiscard]] const instance_record_t &GetInstance(handle_t handle) const;

        [[nodiscard]] const object_array_record_t &GetObjectArray(handle_t handle) const;

        [[nodiscard]] const primitive_array_record_t &GetPrimitiveArray(handle_t handle) const;

        /**
         * Records buffered since the current segment group opened, in stream order.
         */
        [[nodiscard]] const std::vector<handle_t> &GetPendingRecords() const {
            return pending_;
        }

        [[nodiscard]] size_t GetObjectCount() const {
            return instances_.size() + object_arrays_.size() + primitive_arrays_.size();
        }

        /**
         * Opens a segment group. With \a isolate, class definitions and records buffered by earlier groups are dropped
         * first; otherwise they stay visible to the new group.
         */
        void BeginGroup(bool isolate);

        [[nodiscard]] bool IsGroupOpen() const {
            return group_open_;
        }

        void EndGroup();

        [[nodiscard]] size_t GetGroupCount() const {
            return group_count_;
        }

    private:
        handle_t Index(object_id_t object_id, record_kind_t kind, size_t index);

        std::optional<hprof_header_t> header_;
        symbol::SymbolTable symbols_;
        registry::ClassRegistry classes_;
        std::vector<gc_root_t> gc_roots_;

        std::vector<object_id_t> class_records_;
        std::vector<instance_record_t> instances_;
        std::vector<object_array_record_t> object_arrays_;
        std::vector<primitive_array_record_t> primitive_arrays_;
        std::unordered_map<object_id_t, handle_t> objects_;

        std::vector<handle_t> pending_;
        bool group_open_ = false;
        size_t group_count_ = 0;
    };
}

#endif
