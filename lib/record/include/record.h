#ifndef __heapgraph_record_h__
#define __heapgraph_record_h__

#include <optional>

#include "hprof.h"
#include "reader.h"

namespace heapgraph::internal::record {

    /**
     * Reads the file header and configures the identifier size of \a reader.
     * <p>
     * Fails with InvalidHeader if the magic string is not a known HPROF version or the identifier size is neither 4
     * nor 8 bytes.
     */
    hprof_header_t read_header(reader::Reader &reader);

    struct record_t {
        uint8_t raw_tag;
        std::optional<record_tag_t> tag;
        uint32_t timestamp;
        uint32_t length;
        size_t offset;
        reader::Reader payload;
    };

    /**
     * Splits the byte stream after the file header into top-level records.
     * <p>
     * Payloads are slices of the underlying buffer. The stream can only be restarted from its first record.
     */
    class RecordStream {
    public:
        explicit RecordStream(reader::Reader &reader);

        /**
         * Returns the next record, or std::nullopt at the end of input.
         */
        std::optional<record_t> Next();

        void Rewind();

        [[nodiscard]] size_t GetPosition() const {
            return reader_.GetCursor();
        }

    private:
        reader::Reader &reader_;
        const size_t start_;
    };
}

#endif
