#include "include/value.h"

#include "errorha.h"

namespace heapgraph {

    size_t get_value_type_size(value_type_t type, size_t id_size) {
        switch (type) {
            case value_type_t::kObject:
                return id_size;
            case value_type_t::kBoolean:
            case value_type_t::kByte:
                return sizeof(uint8_t);
            case value_type_t::kChar:
            case value_type_t::kShort:
                return sizeof(uint16_t);
            case value_type_t::kFloat:
            case value_type_t::kInt:
                return sizeof(uint32_t);
            case value_type_t::kDouble:
            case value_type_t::kLong:
                return sizeof(uint64_t);
        }
        fatal(error_kind_t::kInvalidValueType, "invalid value type " + std::to_string(static_cast<int>(type)));
    }

    value_type_t value_type_cast(uint8_t type) {
        switch (type) {
            case static_cast<uint8_t>(value_type_t::kObject):
            case static_cast<uint8_t>(value_type_t::kBoolean):
            case static_cast<uint8_t>(value_type_t::kChar):
            case static_cast<uint8_t>(value_type_t::kFloat):
            case static_cast<uint8_t>(value_type_t::kDouble):
            case static_cast<uint8_t>(value_type_t::kByte):
            case static_cast<uint8_t>(value_type_t::kShort):
            case static_cast<uint8_t>(value_type_t::kInt):
            case static_cast<uint8_t>(value_type_t::kLong):
                return static_cast<value_type_t>(type);
            default:
                fatal(error_kind_t::kInvalidValueType, "invalid value type " + std::to_string(type));
        }
    }

    const char *java_type_name(value_type_t type) {
        switch (type) {
            case value_type_t::kObject:
                return "Object";
            case value_type_t::kBoolean:
                return "boolean";
            case value_type_t::kChar:
                return "char";
            case value_type_t::kFloat:
                return "float";
            case value_type_t::kDouble:
                return "double";
            case value_type_t::kByte:
                return "byte";
            case value_type_t::kShort:
                return "short";
            case value_type_t::kInt:
                return "int";
            case value_type_t::kLong:
                return "long";
        }
        return "unknown";
    }
}
