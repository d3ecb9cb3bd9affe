#ifndef __heapgraph_object_h__
#define __heapgraph_object_h__

#include <optional>
#include <string>
#include <vector>

#include "value.h"

namespace heapgraph {

    enum class gc_root_type_t {
        kRootUnknown,
        kRootJniGlobal,
        kRootJniLocal,
        kRootJavaFrame,
        kRootNativeStack,
        kRootStickyClass,
        kRootThreadBlock,
        kRootMonitorUsed,
        kRootThreadObject,
    };

    [[nodiscard]] const char *gc_root_type_name(gc_root_type_t type);

    /**
     * A GC root sub-record. Fields a root kind does not carry are zero.
     */
    struct gc_root_t {
        gc_root_type_t type;
        object_id_t object_id;
        object_id_t jni_global_ref_id;
        uint32_t thread_serial;
        uint32_t frame_number;
        uint32_t stack_trace_serial;

        bool operator==(const gc_root_t &) const = default;
    };

    enum class object_kind_t {
        kInstance,
        kObjectArray,
        kPrimitiveArray,
    };

    /**
     * A decoded field. \a referent_type describes what a non-null reference points at (a class name, a primitive array
     * type such as "int[]", or "class <name>" for class objects); it is absent for primitives, null references and
     * referents that are not in the heap. \a referent_found tells whether the referent is in the heap at all, so a
     * referent whose class has no name can be told apart from a missing one.
     */
    struct resolved_field_t {
        std::optional<std::string> name;
        Value value;
        std::optional<std::string> referent_type;
        bool referent_found = false;

        bool operator==(const resolved_field_t &) const = default;
    };

    struct resolved_element_t {
        object_id_t id;
        std::optional<std::string> referent_type;
        bool referent_found = false;

        [[nodiscard]] bool IsNull() const {
            return id == kNullObjectId;
        }

        bool operator==(const resolved_element_t &) const = default;
    };

    /**
     * An instance or array with every field or element decoded.
     * <p>
     * References are kept as identifiers. Following one to another object is a separate lookup.
     */
    struct ResolvedObject {
        object_kind_t kind;
        object_id_t id;
        uint32_t stack_trace_serial;
        /**
         * Class of an instance, or array class of an object array. Zero for primitive arrays.
         */
        object_id_t class_id;
        std::optional<std::string> class_name;
        /**
         * Instance fields in layout order: declared fields of the class first, then those of each superclass.
         */
        std::vector<resolved_field_t> fields;
        value_type_t element_type;
        /**
         * Elements of a primitive array.
         */
        std::vector<Value> elements;
        /**
         * Elements of an object array.
         */
        std::vector<resolved_element_t> references;

        bool operator==(const ResolvedObject &) const = default;
    };

    struct ResolvedClass {
        object_id_t class_id;
        std::optional<std::string> class_name;
        object_id_t super_class_id;
        uint32_t instance_size;
        std::vector<resolved_field_t> static_fields;

        bool operator==(const ResolvedClass &) const = default;
    };
}

#endif
