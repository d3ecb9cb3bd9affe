#ifndef __heapgraph_main_graph_h__
#define __heapgraph_main_graph_h__

#include "heapgraph.h"
#include "heap.h"
#include "resolver.h"

namespace heapgraph {

    class HprofGraphImpl {
    public:
        HprofGraphImpl(const internal::heap::Heap &heap, bool describe_references);

        [[nodiscard]] std::optional<ResolvedObject> Resolve(object_id_t object_id) const;

        [[nodiscard]] std::optional<ResolvedClass> ResolveClass(object_id_t class_id) const;

        [[nodiscard]] std::optional<std::string> GetClassName(object_id_t class_id) const;

        [[nodiscard]] std::optional<object_id_t> GetSuperClass(object_id_t class_id) const;

        [[nodiscard]] std::optional<object_id_t> FindClassByName(const std::string &class_name) const;

        [[nodiscard]] const std::vector<gc_root_t> &GetGcRoots() const;

        [[nodiscard]] const hprof_header_t &GetHeader() const;

        [[nodiscard]] size_t GetIdSize() const;

    private:
        const internal::heap::Heap &heap_;
        const internal::resolver::ObjectGraphResolver resolver_;
    };
}

#endif
