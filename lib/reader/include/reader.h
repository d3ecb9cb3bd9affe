#ifndef __heapgraph_reader_h__
#define __heapgraph_reader_h__

#include <cstddef>
#include <cstdint>
#include <string>

#include "macro.h"

namespace heapgraph::internal::reader {

    /**
     * Bounds-checked forward reader over a borrowed byte buffer. All multi-byte values are big-endian.
     * <p>
     * Every read fails with TruncatedInput before moving the cursor if fewer bytes than requested remain. Slices share
     * the source buffer and are bounded by their own length, so a sub-record decoder working on a slice can never
     * read past the record that contains it.
     */
    class Reader {
    public:
        Reader(const uint8_t *source, size_t buffer_size, size_t id_size = 0);

        uint8_t ReadU1() {
            return Read(sizeof(uint8_t));
        }

        void SkipU1() {
            Skip(sizeof(uint8_t));
        }

        uint16_t ReadU2() {
            return Read(sizeof(uint16_t));
        }

        void SkipU2() {
            Skip(sizeof(uint16_t));
        }

        uint32_t ReadU4() {
            return Read(sizeof(uint32_t));
        }

        void SkipU4() {
            Skip(sizeof(uint32_t));
        }

        uint64_t ReadU8() {
            return Read(sizeof(uint64_t));
        }

        void SkipU8() {
            Skip(sizeof(uint64_t));
        }

        /**
         * Reads an identifier using the identifier size this reader was created with.
         */
        uint64_t ReadId();

        void SkipId();

        void SetIdSize(size_t id_size);

        [[nodiscard]] size_t GetIdSize() const;

        std::string ReadString(size_t length);

        std::string ReadNullTerminatedString();

        uint64_t Read(size_t size);

        void Skip(size_t size);

        /**
         * Returns a reader over the next \a size bytes and moves past them. No bytes are copied.
         */
        Reader Slice(size_t size);

        const uint8_t *Extract(size_t size);

        void ResetCursor();

        /**
         * Fails with UnconsumedPayload if any byte is left. \a what names the payload in the error message.
         */
        void ExpectConsumed(const char *what) const;

        [[nodiscard]] size_t GetCursor() const {
            return cursor_;
        }

        [[nodiscard]] size_t GetSize() const {
            return buffer_size_;
        }

        [[nodiscard]] size_t Remaining() const {
            return buffer_size_ - cursor_;
        }

        [[nodiscard]] bool IsEnd() const {
            return cursor_ == buffer_size_;
        }

    private:
        void Require(size_t size) const;

        size_t buffer_size_;
        const uint8_t *buffer_;
        size_t cursor_;
        size_t id_size_;
    };
}

#endif
