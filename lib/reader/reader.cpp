#include "errorha.h"
#include "include/reader.h"

#include <sstream>

namespace heapgraph::internal::reader {

    Reader::Reader(const uint8_t *source, size_t buffer_size, size_t id_size) :
            buffer_size_(buffer_size),
            buffer_(source),
            cursor_(0),
            id_size_(id_size) {}

    uint64_t Reader::ReadId() {
        return Read(GetIdSize());
    }

    void Reader::SkipId() {
        Skip(GetIdSize());
    }

    void Reader::SetIdSize(size_t id_size) {
        id_size_ = id_size;
    }

    size_t Reader::GetIdSize() const {
        if (id_size_ == 0) {
            throw std::logic_error("Identifier size is not initialized.");
        }
        return id_size_;
    }

    std::string Reader::ReadString(size_t length) {
        const char *content = reinterpret_cast<const char *>(Extract(length));
        return {content, length};
    }

    std::string Reader::ReadNullTerminatedString() {
        std::stringstream stream;
        char current;
        while ((current = static_cast<char>(ReadU1())) != '\0') {
            stream << current;
        }
        return stream.str();
    }

    uint64_t Reader::Read(size_t size) {
        if (size > sizeof(uint64_t)) {
            throw std::logic_error("Invalid read size " + std::to_string(size) + ".");
        }
        Require(size);
        uint64_t ret = 0;
        for (size_t i = 0; i < size; ++i) {
            ret = (ret << 8) | buffer_[cursor_];
            cursor_ += sizeof(uint8_t);
        }
        return ret;
    }

    void Reader::Skip(size_t size) {
        Require(size);
        cursor_ += size;
    }

    Reader Reader::Slice(size_t size) {
        const uint8_t *data = Extract(size);
        return {data, size, id_size_};
    }

    const uint8_t *Reader::Extract(size_t size) {
        Require(size);
        const uint8_t *ret = buffer_ + cursor_;
        cursor_ += size;
        return ret;
    }

    void Reader::ResetCursor() {
        cursor_ = 0;
    }

    void Reader::ExpectConsumed(const char *what) const {
        if (!IsEnd()) {
            std::stringstream error_builder;
            error_builder << what << " left " << Remaining() << " of " << buffer_size_ << " bytes unread";
            fatal(error_kind_t::kUnconsumedPayload, error_builder.str());
        }
    }

    void Reader::Require(size_t size) const {
        if (size > Remaining()) {
            std::stringstream error_builder;
            error_builder << "Reach the end of buffer: need " << size << " bytes at offset " << cursor_
                          << ", " << Remaining() << " left.";
            fatal(error_kind_t::kTruncatedInput, error_builder.str());
        }
    }
}
