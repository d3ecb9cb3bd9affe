#include "include/resolver.h"

#include <sstream>
#include <stdexcept>

#include "errorha.h"
#include "macro.h"

namespace heapgraph::internal::resolver {

    ObjectGraphResolver::ObjectGraphResolver(const heap::Heap &heap, bool describe_references) :
            heap_(heap),
            describe_references_(describe_references) {}

    ResolvedObject ObjectGraphResolver::Resolve(heap::handle_t handle) const {
        switch (handle.kind) {
            case heap::record_kind_t::kInstance:
                return ResolveInstance(heap_.GetInstance(handle));
            case heap::record_kind_t::kObjectArray:
                return ResolveObjectArray(heap_.GetObjectArray(handle));
            case heap::record_kind_t::kPrimitiveArray:
                return ResolvePrimitiveArray(heap_.GetPrimitiveArray(handle));
            case heap::record_kind_t::kClass:
                break;
        }
        throw std::logic_error("Class records resolve to ResolvedClass.");
    }

    ResolvedObject ObjectGraphResolver::ResolveInstance(const heap::instance_record_t &record) const {
        const registry::ClassRegistry &classes = heap_.GetClasses();
        if (classes.Lookup(record.class_id) == nullptr) {
            std::stringstream error_builder;
            error_builder << "class " << record.class_id << " of instance " << record.id << " is not dumped";
            reject(error_kind_t::kUnknownClass, error_builder.str());
        }
        const std::vector<registry::field_t> &layout = classes.GetFieldLayout(record.class_id);
        const size_t layout_size = classes.GetFieldLayoutSize(record.class_id, heap_.GetIdSize());
        if (layout_size != record.data_size) {
            std::stringstream error_builder;
            error_builder << "instance " << record.id << " carries " << record.data_size
                          << " bytes of fields, class " << record.class_id << " lays out " << layout_size;
            reject(error_kind_t::kFieldLayoutMismatch, error_builder.str());
        }

        ResolvedObject result{
                .kind = object_kind_t::kInstance,
                .id = record.id,
                .stack_trace_serial = record.stack_trace_serial,
                .class_id = record.class_id,
                .class_name = heap_.GetSymbols().GetClassName(record.class_id),
                .fields = {},
                .element_type = value_type_t::kObject,
                .elements = {},
                .references = {}
        };
        result.fields.reserve(layout.size());
        reader::Reader fields_reader(record.data, record.data_size, heap_.GetIdSize());
        for (const auto &field: layout) {
            result.fields.emplace_back(ResolveField(field.name_id, heap::read_value(fields_reader, field.type)));
        }
        return result;
    }

    ResolvedObject ObjectGraphResolver::ResolveObjectArray(const heap::object_array_record_t &record) const {
        ResolvedObject result{
                .kind = object_kind_t::kObjectArray,
                .id = record.id,
                .stack_trace_serial = record.stack_trace_serial,
                .class_id = record.array_class_id,
                .class_name = heap_.GetSymbols().GetClassName(record.array_class_id),
                .fields = {},
                .element_type = value_type_t::kObject,
                .elements = {},
                .references = {}
        };
        result.references.reserve(record.length);
        const size_t id_size = heap_.GetIdSize();
        reader::Reader elements_reader(record.data, record.length * id_size, id_size);
        for (uint32_t i = 0; i < record.length; ++i) {
            const object_id_t element_id = elements_reader.ReadId();
            const bool describe = describe_references_ && element_id != kNullObjectId;
            result.references.emplace_back(resolved_element_t{
                    .id = element_id,
                    .referent_type = describe ? DescribeReferent(element_id) : std::nullopt,
                    .referent_found = describe && heap_.FindObject(element_id).has_value()
            });
        }
        return result;
    }

    ResolvedObject ObjectGraphResolver::ResolvePrimitiveArray(const heap::primitive_array_record_t &record) const {
        ResolvedObject result{
                .kind = object_kind_t::kPrimitiveArray,
                .id = record.id,
                .stack_trace_serial = record.stack_trace_serial,
                .class_id = kNullObjectId,
                .class_name = std::string(java_type_name(record.element_type)) + "[]",
                .fields = {},
                .element_type = record.element_type,
                .elements = {},
                .references = {}
        };
        result.elements.reserve(record.length);
        const size_t id_size = heap_.GetIdSize();
        const size_t element_size = get_value_type_size(record.element_type, id_size);
        reader::Reader elements_reader(record.data, record.length * element_size, id_size);
        for (uint32_t i = 0; i < record.length; ++i) {
            result.elements.emplace_back(heap::read_value(elements_reader, record.element_type));
        }
        return result;
    }

    ResolvedClass ObjectGraphResolver::ResolveClass(object_id_t class_id) const {
        const registry::class_def_t *class_def = heap_.GetClasses().Lookup(class_id);
        if (class_def == nullptr) {
            std::stringstream error_builder;
            error_builder << "class " << class_id << " is not dumped";
            reject(error_kind_t::kUnknownClass, error_builder.str());
        }
        ResolvedClass result{
                .class_id = class_id,
                .class_name = heap_.GetSymbols().GetClassName(class_id),
                .super_class_id = class_def->super_class_id,
                .instance_size = class_def->instance_size,
                .static_fields = {}
        };
        for (const auto &static_field: class_def->static_fields) {
            result.static_fields.emplace_back(ResolveField(static_field.name_id, static_field.value));
        }
        return result;
    }

    std::optional<std::string> ObjectGraphResolver::DescribeReferent(object_id_t object_id) const {
        if (object_id == kNullObjectId) return std::nullopt;
        const heap::handle_t handle = unwrap(heap_.FindObject(object_id), return std::nullopt);
        switch (handle.kind) {
            case heap::record_kind_t::kInstance:
                return heap_.GetSymbols().GetClassName(heap_.GetInstance(handle).class_id);
            case heap::record_kind_t::kObjectArray:
                return heap_.GetSymbols().GetClassName(heap_.GetObjectArray(handle).array_class_id);
            case heap::record_kind_t::kPrimitiveArray:
                return std::string(java_type_name(heap_.GetPrimitiveArray(handle).element_type)) + "[]";
            case heap::record_kind_t::kClass: {
                const std::string class_name = unwrap(heap_.GetSymbols().GetClassName(object_id),
                                                      return std::nullopt);
                return "class " + class_name;
            }
        }
        return std::nullopt;
    }

    resolved_field_t ObjectGraphResolver::ResolveField(string_id_t name_id, const Value &value) const {
        const bool describe = describe_references_ && value.IsReference() && !value.IsNull();
        return resolved_field_t{
                .name = heap_.GetSymbols().GetString(name_id),
                .value = value,
                .referent_type = describe ? DescribeReferent(value.AsObjectId()) : std::nullopt,
                .referent_found = describe && heap_.FindObject(value.AsObjectId()).has_value()
        };
    }
}
