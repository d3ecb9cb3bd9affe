#ifndef __heapgraph_h__
#define __heapgraph_h__

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "event.h"
#include "hprof.h"
#include "object.h"
#include "value.h"

#include "macro.h"

namespace heapgraph {

    class HprofGraphImpl;

    /**
     * Read-only view over the decoded heap, valid only inside the inspector callback passed to HprofDecoder::Decode.
     */
    class HprofGraph {
    public:
        /**
         * Resolves the instance or array with identifier \a object_id, or returns std::nullopt if it is not in the
         * heap or cannot be resolved.
         */
        [[nodiscard]] std::optional<ResolvedObject> Resolve(object_id_t object_id) const;

        /**
         * Resolves the class with identifier \a class_id, or returns std::nullopt if the class is not dumped.
         */
        [[nodiscard]] std::optional<ResolvedClass> ResolveClass(object_id_t class_id) const;

        /**
         * Gets class name with class identifier in HPROF file \a class_id, or returns std::nullopt if the record is not
         * found.
         */
        [[nodiscard]] std::optional<std::string> GetClassName(object_id_t class_id) const;

        /**
         * Gets super class identifier of class \a class_id, or returns std::nullopt if the class is not dumped or has
         * no superclass.
         */
        [[nodiscard]] std::optional<object_id_t> GetSuperClass(object_id_t class_id) const;

        /**
         * Gets class identifier with class name \a class_name as written in the file (e.g. "java/lang/String"), or
         * returns std::nullopt if no such class is loaded.
         */
        [[nodiscard]] std::optional<object_id_t> FindClassByName(const std::string &class_name) const;

        [[nodiscard]] const std::vector<gc_root_t> &GetGcRoots() const;

        [[nodiscard]] const hprof_header_t &GetHeader() const;

        [[nodiscard]] size_t GetIdSize() const;

    private:
        friend class HprofDecoderImpl;

        explicit HprofGraph(HprofGraphImpl *impl);

        friend_test(main_graph, delegate);

    public:
        ~HprofGraph();

    private:
        std::unique_ptr<HprofGraphImpl> impl_;
    };

    class HprofDecoderImpl;

    class HprofDecoder {
    public:
        /**
         * Returns the last fatal error message of the calling thread.
         */
        static const char *CheckError();

        /**
         * Maps the regular file \a hprof_fd. The descriptor is not owned and may be closed once the constructor
         * returns.
         */
        explicit HprofDecoder(int hprof_fd);

        ~HprofDecoder();

        void SetObjectDecoding(bool enabled);

        void SetGroupIsolation(bool enabled);

        void SetReferenceDescription(bool enabled);

        /**
         * Decodes the whole file, passing every event to \a handler, then hands the decoded heap to \a inspector if
         * one is given.
         * <p>
         * Returns std::nullopt if the file could not be mapped or decoding hit a fatal error; CheckError tells why.
         * Recoverable errors do not fail the decode: they arrive as DecodeError events and are counted in the
         * summary.
         */
        std::optional<DecodeSummary> Decode(const event_handler_t &handler,
                                            const std::function<void(const HprofGraph &)> &inspector = nullptr);

    private:
        std::unique_ptr<HprofDecoderImpl> impl_;
    };
}

#endif
