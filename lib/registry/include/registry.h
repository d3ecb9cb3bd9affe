#ifndef __heapgraph_registry_h__
#define __heapgraph_registry_h__

#include <deque>
#include <optional>
#include <unordered_map>
#include <vector>

#include "value.h"

namespace heapgraph::internal::registry {

    struct field_t {
        string_id_t name_id;
        value_type_t type;
    };

    struct static_field_t {
        string_id_t name_id;
        Value value;
    };

    struct constant_t {
        uint16_t index;
        Value value;
    };

    struct class_def_t {
        object_id_t class_id;
        uint32_t stack_trace_serial;
        object_id_t super_class_id;
        object_id_t class_loader_id;
        object_id_t signers_id;
        object_id_t protection_domain_id;
        uint32_t instance_size;
        std::vector<constant_t> constant_pool;
        std::vector<static_field_t> static_fields;
        std::vector<field_t> instance_fields;
    };

    /**
     * Class dumps keyed by class object identifier.
     * <p>
     * Definitions live in an append-only arena, so pointers returned by Lookup stay valid until Clear is called.
     */
    class ClassRegistry {
    public:
        /**
         * Stores \a class_def. A second definition for the same class id fails with DuplicateClassDef and is dropped.
         */
        void Register(class_def_t &&class_def);

        /**
         * Returns the definition of class \a class_id, or nullptr if it has not been dumped (yet).
         */
        [[nodiscard]] const class_def_t *Lookup(object_id_t class_id) const;

        /**
         * Returns the full instance field layout of \a class_id: its own declared fields followed by those of its
         * superclass, recursively.
         * <p>
         * Fails with UnknownClass if \a class_id is not registered, and with DanglingSuperclass if a class on the
         * chain names a superclass that is not registered or the chain loops. Successful layouts are cached.
         */
        const std::vector<field_t> &GetFieldLayout(object_id_t class_id) const;

        /**
         * Sum of the encoded sizes of all fields in the layout of \a class_id.
         */
        [[nodiscard]] size_t GetFieldLayoutSize(object_id_t class_id, size_t id_size) const;

        /**
         * Returns the superclass id named by \a class_id if that superclass is not registered.
         */
        [[nodiscard]] std::optional<object_id_t> FindDanglingSuperclass(object_id_t class_id) const;

        [[nodiscard]] size_t GetClassCount() const {
            return classes_.size();
        }

        void Clear();

    private:
        std::deque<class_def_t> classes_;
        std::unordered_map<object_id_t, size_t> index_;
        mutable std::unordered_map<object_id_t, std::vector<field_t>> layouts_;
    };
}

#endif
