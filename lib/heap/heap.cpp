#include "include/heap.h"

#include <stdexcept>

#include "logger.h"

namespace heapgraph::internal::heap {

    Value read_value(reader::Reader &reader, value_type_t type) {
        if (type == value_type_t::kObject) return Value::Reference(reader.ReadId());
        return {type, reader.Read(get_value_type_size(type, reader.GetIdSize()))};
    }

    void Heap::SetHeader(const hprof_header_t &header) {
        header_ = header;
    }

    const hprof_header_t &Heap::GetHeader() const {
        if (!header_.has_value()) {
            throw std::logic_error("HPROF header is not parsed.");
        }
        return header_.value();
    }

    size_t Heap::GetIdSize() const {
        return GetHeader().id_size;
    }

    void Heap::AddGcRoot(const gc_root_t &gc_root) {
        gc_roots_.emplace_back(gc_root);
    }

    handle_t Heap::AddClass(object_id_t class_id) {
        class_records_.emplace_back(class_id);
        return Index(class_id, record_kind_t::kClass, class_records_.size() - 1);
    }

    handle_t Heap::AddInstance(const instance_record_t &record) {
        instances_.emplace_back(record);
        return Index(record.id, record_kind_t::kInstance, instances_.size() - 1);
    }

    handle_t Heap::AddObjectArray(const object_array_record_t &record) {
        object_arrays_.emplace_back(record);
        return Index(record.id, record_kind_t::kObjectArray, object_arrays_.size() - 1);
    }

    handle_t Heap::AddPrimitiveArray(const primitive_array_record_t &record) {
        primitive_arrays_.emplace_back(record);
        return Index(record.id, record_kind_t::kPrimitiveArray, primitive_arrays_.size() - 1);
    }

    handle_t Heap::Index(object_id_t object_id, record_kind_t kind, size_t index) {
        const handle_t handle{.kind = kind, .index = static_cast<uint32_t>(index)};
        if (!objects_.emplace(object_id, handle).second) {
            hgWarn("object %llu is dumped more than once, keeping the first record",
                   static_cast<unsigned long long>(object_id));
        }
        pending_.emplace_back(handle);
        return handle;
    }

    std::optional<handle_t> Heap::FindObject(object_id_t object_id) const {
        const auto it = objects_.find(object_id);
        if (it == objects_.end()) return std::nullopt;
        return it->second;
    }

    object_id_t Heap::GetClassRecord(handle_t handle) const {
        return class_records_.at(handle.index);
    }

    const instance_record_t &Heap::GetInstance(handle_t handle) const {
        return instances_.at(handle.index);
    }

    const object_array_record_t &Heap::GetObjectArray(handle_t handle) const {
        return object_arrays_.at(handle.index);
    }

    const primitive_array_record_t &Heap::GetPrimitiveArray(handle_t handle) const {
        return primitive_arrays_.at(handle.index);
    }

    void Heap::BeginGroup(bool isolate) {
        if (isolate && group_count_ > 0) {
            classes_.Clear();
            class_records_.clear();
            instances_.clear();
            object_arrays_.clear();
            primitive_arrays_.clear();
            objects_.clear();
        }
        group_open_ = true;
        ++group_count_;
        pending_.clear();
        hgDebug("segment group %zu opened", group_count_);
    }

    void Heap::EndGroup() {
        hgDebug("segment group %zu closed with %zu records", group_count_, pending_.size());
        group_open_ = false;
        pending_.clear();
    }
}
