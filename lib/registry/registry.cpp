#include "include/registry.h"

#include <sstream>
#include <unordered_set>

#include "errorha.h"
#include "logger.h"

namespace heapgraph::internal::registry {

    void ClassRegistry::Register(class_def_t &&class_def) {
        const object_id_t class_id = class_def.class_id;
        if (index_.find(class_id) != index_.end()) {
            std::stringstream error_builder;
            error_builder << "class " << class_id << " is dumped more than once";
            reject(error_kind_t::kDuplicateClassDef, error_builder.str());
        }
        index_.emplace(class_id, classes_.size());
        classes_.emplace_back(std::move(class_def));
    }

    const class_def_t *ClassRegistry::Lookup(object_id_t class_id) const {
        const auto it = index_.find(class_id);
        if (it == index_.end()) return nullptr;
        return &classes_[it->second];
    }

    const std::vector<field_t> &ClassRegistry::GetFieldLayout(object_id_t class_id) const {
        const auto cached = layouts_.find(class_id);
        if (cached != layouts_.end()) return cached->second;

        const class_def_t *current = Lookup(class_id);
        if (current == nullptr) {
            std::stringstream error_builder;
            error_builder << "class " << class_id << " is not dumped";
            reject(error_kind_t::kUnknownClass, error_builder.str());
        }

        std::vector<field_t> layout;
        std::unordered_set<object_id_t> visited;
        while (true) {
            if (!visited.insert(current->class_id).second) {
                std::stringstream error_builder;
                error_builder << "superclass chain of class " << class_id << " loops at class " << current->class_id;
                reject(error_kind_t::kDanglingSuperclass, error_builder.str());
            }
            layout.insert(layout.end(), current->instance_fields.begin(), current->instance_fields.end());
            if (current->super_class_id == kNullObjectId) break;
            const class_def_t *super_class = Lookup(current->super_class_id);
            if (super_class == nullptr) {
                std::stringstream error_builder;
                error_builder << "superclass " << current->super_class_id << " of class " << current->class_id
                              << " is not dumped";
                reject(error_kind_t::kDanglingSuperclass, error_builder.str());
            }
            current = super_class;
        }
        return layouts_.emplace(class_id, std::move(layout)).first->second;
    }

    size_t ClassRegistry::GetFieldLayoutSize(object_id_t class_id, size_t id_size) const {
        size_t size = 0;
        for (const auto &field: GetFieldLayout(class_id)) {
            size += get_value_type_size(field.type, id_size);
        }
        return size;
    }

    std::optional<object_id_t> ClassRegistry::FindDanglingSuperclass(object_id_t class_id) const {
        const class_def_t *class_def = Lookup(class_id);
        if (class_def == nullptr || class_def->super_class_id == kNullObjectId) return std::nullopt;
        if (Lookup(class_def->super_class_id) != nullptr) return std::nullopt;
        return class_def->super_class_id;
    }

    void ClassRegistry::Clear() {
        hgDebug("dropping %zu class definitions", classes_.size());
        classes_.clear();
        index_.clear();
        layouts_.clear();
    }
}
