#ifndef __heapgraph_value_h__
#define __heapgraph_value_h__

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace heapgraph {

    typedef uint64_t object_id_t;
    typedef uint64_t string_id_t;

    /**
     * Identifier value 0 is the null reference in every HPROF file.
     */
    static constexpr object_id_t kNullObjectId = 0;

    enum class value_type_t : uint8_t {
        kObject = 2,
        kBoolean = 4,
        kChar = 5,
        kFloat = 6,
        kDouble = 7,
        kByte = 8,
        kShort = 9,
        kInt = 10,
        kLong = 11,
    };

    /**
     * Returns the encoded size of a value of \a type; object references take \a id_size bytes.
     */
    [[nodiscard]] size_t get_value_type_size(value_type_t type, size_t id_size);

    /**
     * Converts an HPROF basic type byte, failing with InvalidValueType for anything else (including the unused
     * array-object type 1).
     */
    value_type_t value_type_cast(uint8_t type);

    [[nodiscard]] const char *java_type_name(value_type_t type);

    /**
     * A typed field, static field or array element value. The raw bits are kept exactly as decoded (zero-extended to
     * 64 bits) so that two values decoded from the same bytes compare equal.
     */
    class Value {
    public:
        Value() : type_(value_type_t::kObject), bits_(0) {}

        Value(value_type_t type, uint64_t bits) : type_(type), bits_(bits) {}

        static Value Reference(object_id_t id) {
            return {value_type_t::kObject, id};
        }

        [[nodiscard]] value_type_t GetType() const {
            return type_;
        }

        [[nodiscard]] uint64_t GetBits() const {
            return bits_;
        }

        [[nodiscard]] bool IsReference() const {
            return type_ == value_type_t::kObject;
        }

        [[nodiscard]] bool IsNull() const {
            return IsReference() && bits_ == kNullObjectId;
        }

        [[nodiscard]] object_id_t AsObjectId() const {
            return bits_;
        }

        [[nodiscard]] bool AsBoolean() const {
            return bits_ != 0;
        }

        [[nodiscard]] int8_t AsByte() const {
            return static_cast<int8_t>(static_cast<uint8_t>(bits_));
        }

        [[nodiscard]] uint16_t AsChar() const {
            return static_cast<uint16_t>(bits_);
        }

        [[nodiscard]] int16_t AsShort() const {
            return static_cast<int16_t>(static_cast<uint16_t>(bits_));
        }

        [[nodiscard]] int32_t AsInt() const {
            return static_cast<int32_t>(static_cast<uint32_t>(bits_));
        }

        [[nodiscard]] int64_t AsLong() const {
            return static_cast<int64_t>(bits_);
        }

        [[nodiscard]] float AsFloat() const {
            const auto raw = static_cast<uint32_t>(bits_);
            float value;
            memcpy(&value, &raw, sizeof(value));
            return value;
        }

        [[nodiscard]] double AsDouble() const {
            double value;
            memcpy(&value, &bits_, sizeof(value));
            return value;
        }

        bool operator==(const Value &other) const {
            return type_ == other.type_ && bits_ == other.bits_;
        }

        bool operator!=(const Value &other) const {
            return !(*this == other);
        }

    private:
        value_type_t type_;
        uint64_t bits_;
    };
}

#endif
