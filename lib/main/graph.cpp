#include "internal/main_graph.h"

#include "errorha.h"
#include "macro.h"

namespace heapgraph {

    // public interface

    HprofGraph::HprofGraph(HprofGraphImpl *impl) : impl_(impl) {}

    HprofGraph::~HprofGraph() = default;

    std::optional<ResolvedObject> HprofGraph::Resolve(object_id_t object_id) const {
        return impl_->Resolve(object_id);
    }

    std::optional<ResolvedClass> HprofGraph::ResolveClass(object_id_t class_id) const {
        return impl_->ResolveClass(class_id);
    }

    std::optional<std::string> HprofGraph::GetClassName(object_id_t class_id) const {
        return impl_->GetClassName(class_id);
    }

    std::optional<object_id_t> HprofGraph::GetSuperClass(object_id_t class_id) const {
        return impl_->GetSuperClass(class_id);
    }

    std::optional<object_id_t> HprofGraph::FindClassByName(const std::string &class_name) const {
        return impl_->FindClassByName(class_name);
    }

    const std::vector<gc_root_t> &HprofGraph::GetGcRoots() const {
        return impl_->GetGcRoots();
    }

    const hprof_header_t &HprofGraph::GetHeader() const {
        return impl_->GetHeader();
    }

    size_t HprofGraph::GetIdSize() const {
        return impl_->GetIdSize();
    }

    // implementation

    HprofGraphImpl::HprofGraphImpl(const internal::heap::Heap &heap, bool describe_references) :
            heap_(heap),
            resolver_(heap, describe_references) {}

    std::optional<ResolvedObject> HprofGraphImpl::Resolve(object_id_t object_id) const {
        const internal::heap::handle_t handle = unwrap(heap_.FindObject(object_id), return std::nullopt);
        if (handle.kind == internal::heap::record_kind_t::kClass) return std::nullopt;
        try {
            return resolver_.Resolve(handle);
        } catch (const HprofError &error) {
            set_heapgraph_error(error.what());
            return std::nullopt;
        }
    }

    std::optional<ResolvedClass> HprofGraphImpl::ResolveClass(object_id_t class_id) const {
        if (heap_.GetClasses().Lookup(class_id) == nullptr) return std::nullopt;
        return resolver_.ResolveClass(class_id);
    }

    std::optional<std::string> HprofGraphImpl::GetClassName(object_id_t class_id) const {
        return heap_.GetSymbols().GetClassName(class_id);
    }

    std::optional<object_id_t> HprofGraphImpl::GetSuperClass(object_id_t class_id) const {
        const internal::registry::class_def_t *class_def = heap_.GetClasses().Lookup(class_id);
        if (class_def == nullptr || class_def->super_class_id == kNullObjectId) return std::nullopt;
        return class_def->super_class_id;
    }

    std::optional<object_id_t> HprofGraphImpl::FindClassByName(const std::string &class_name) const {
        return heap_.GetSymbols().FindClassByName(class_name);
    }

    const std::vector<gc_root_t> &HprofGraphImpl::GetGcRoots() const {
        return heap_.GetGcRoots();
    }

    const hprof_header_t &HprofGraphImpl::GetHeader() const {
        return heap_.GetHeader();
    }

    size_t HprofGraphImpl::GetIdSize() const {
        return heap_.GetIdSize();
    }
}
