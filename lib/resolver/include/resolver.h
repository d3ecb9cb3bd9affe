#ifndef __heapgraph_resolver_h__
#define __heapgraph_resolver_h__

#include <optional>
#include <string>

#include "heap.h"
#include "object.h"

namespace heapgraph::internal::resolver {

    /**
     * Decodes buffered records into ResolvedObject and ResolvedClass values.
     * <p>
     * Resolution reads only the heap and never changes it, so resolving the same record twice yields equal results.
     * Failures are scoped to the record being resolved: UnknownClass, DanglingSuperclass and FieldLayoutMismatch.
     */
    class ObjectGraphResolver {
    public:
        explicit ObjectGraphResolver(const heap::Heap &heap, bool describe_references = true);

        [[nodiscard]] ResolvedObject Resolve(heap::handle_t handle) const;

        [[nodiscard]] ResolvedObject ResolveInstance(const heap::instance_record_t &record) const;

        [[nodiscard]] ResolvedObject ResolveObjectArray(const heap::object_array_record_t &record) const;

        [[nodiscard]] ResolvedObject ResolvePrimitiveArray(const heap::primitive_array_record_t &record) const;

        [[nodiscard]] ResolvedClass ResolveClass(object_id_t class_id) const;

        /**
         * Describes the type of the object \a object_id as found in the object index, or returns std::nullopt if
         * the object is not in the heap. Null is never described.
         */
        [[nodiscard]] std::optional<std::string> DescribeReferent(object_id_t object_id) const;

    private:
        [[nodiscard]] resolved_field_t ResolveField(string_id_t name_id, const Value &value) const;

        const heap::Heap &heap_;
        const bool describe_references_;
    };
}

#endif
