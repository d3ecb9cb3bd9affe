#include "internal/main_decoder.h"
#include "internal/main_graph.h"

#include <sys/mman.h>
#include <sys/stat.h>
#include <cerrno>

#include "errorha.h"
#include "heap.h"
#include "logger.h"

namespace heapgraph {

    // public interface

    const char *HprofDecoder::CheckError() {
        return get_heapgraph_error();
    }

    HprofDecoder::HprofDecoder(int hprof_fd) : impl_(HprofDecoderImpl::Create(hprof_fd)) {}

    HprofDecoder::~HprofDecoder() = default;

    void HprofDecoder::SetObjectDecoding(bool enabled) {
        if (impl_ != nullptr) {
            impl_->GetOptions().decode_objects = enabled;
        }
    }

    void HprofDecoder::SetGroupIsolation(bool enabled) {
        if (impl_ != nullptr) {
            impl_->GetOptions().isolate_groups = enabled;
        }
    }

    void HprofDecoder::SetReferenceDescription(bool enabled) {
        if (impl_ != nullptr) {
            impl_->GetOptions().describe_references = enabled;
        }
    }

    std::optional<DecodeSummary>
    HprofDecoder::Decode(const event_handler_t &handler,
                         const std::function<void(const HprofGraph &)> &inspector) {
        if (impl_ != nullptr) {
            return impl_->Decode(handler, inspector);
        } else {
            return std::nullopt;
        }
    }

    // implementation

    std::unique_ptr<HprofDecoderImpl> HprofDecoderImpl::Create(int hprof_fd) {
        struct stat file_stat{};
        if (fstat(hprof_fd, &file_stat)) {
            set_heapgraph_error("Failed to invoke fstat with errno " + std::to_string(errno) + ".");
            return nullptr;
        }
        if (!S_ISREG(file_stat.st_mode)) {
            set_heapgraph_error("File descriptor is not a regular file.");
            return nullptr;
        }
        const size_t data_size = file_stat.st_size;
        if (data_size == 0) {
            set_heapgraph_error("File is empty.");
            return nullptr;
        }
        void *data = mmap(nullptr, data_size, PROT_READ, MAP_PRIVATE, hprof_fd, 0);
        if (data == MAP_FAILED) {
            set_heapgraph_error("Failed to mmap file with errno " + std::to_string(errno) + ".");
            return nullptr;
        }
        return std::make_unique<HprofDecoderImpl>(data, data_size);
    }

    HprofDecoderImpl::HprofDecoderImpl(void *data, size_t data_size) :
            data_(data),
            data_size_(data_size),
            parser_(new internal::parser::HeapParser()),
            options_() {}

    HprofDecoderImpl::~HprofDecoderImpl() {
        munmap(data_, data_size_);
    }

    std::optional<DecodeSummary>
    HprofDecoderImpl::Decode(const event_handler_t &handler,
                             const std::function<void(const HprofGraph &)> &inspector) {
        internal::heap::Heap heap;
        internal::reader::Reader reader(reinterpret_cast<const uint8_t *>(data_), data_size_);
        internal::parser::DecodeContext context(options_, handler);
        try {
            parser_->Parse(reader, heap, context);
        } catch (const HprofError &error) {
            set_heapgraph_error(error.what());
            return std::nullopt;
        }

        DecodeSummary summary = context.GetSummary();
        summary.group_count = heap.GetGroupCount();
        if (summary.GetErrorCount() > 0) {
            hgWarn("decoded with %zu recoverable errors", summary.GetErrorCount());
        }
        if (inspector) {
            const HprofGraph graph(new HprofGraphImpl(heap, options_.describe_references));
            inspector(graph);
        }
        return summary;
    }
}
