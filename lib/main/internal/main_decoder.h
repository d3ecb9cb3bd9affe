#ifndef __heapgraph_main_decoder_h__
#define __heapgraph_main_decoder_h__

#include "heapgraph.h"
#include "parser.h"

namespace heapgraph {

    class HprofDecoderImpl {
    public:
        static std::unique_ptr<HprofDecoderImpl> Create(int hprof_fd);

        HprofDecoderImpl(void *data, size_t data_size);

        ~HprofDecoderImpl();

        DecodeOptions &GetOptions() {
            return options_;
        }

        std::optional<DecodeSummary> Decode(const event_handler_t &handler,
                                            const std::function<void(const HprofGraph &)> &inspector);

    private:
        void *data_;
        size_t data_size_;
        const std::unique_ptr<internal::parser::HeapParser> parser_;
        DecodeOptions options_;
    };
}

#endif
