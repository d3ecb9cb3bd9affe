#include "include/errorha.h"

#include "logger.h"

namespace heapgraph {

    bool is_fatal_error(error_kind_t kind) {
        switch (kind) {
            case error_kind_t::kTruncatedInput:
            case error_kind_t::kUnconsumedPayload:
            case error_kind_t::kInvalidHeader:
            case error_kind_t::kUnknownSubRecord:
            case error_kind_t::kInvalidValueType:
                return true;
            default:
                return false;
        }
    }

    const char *error_kind_name(error_kind_t kind) {
        switch (kind) {
            case error_kind_t::kTruncatedInput:
                return "TruncatedInput";
            case error_kind_t::kUnconsumedPayload:
                return "UnconsumedPayload";
            case error_kind_t::kInvalidHeader:
                return "InvalidHeader";
            case error_kind_t::kUnknownSubRecord:
                return "UnknownSubRecord";
            case error_kind_t::kInvalidValueType:
                return "InvalidValueType";
            case error_kind_t::kUnknownTag:
                return "UnknownTag";
            case error_kind_t::kInvalidSymbol:
                return "InvalidSymbol";
            case error_kind_t::kDuplicateClassDef:
                return "DuplicateClassDef";
            case error_kind_t::kDanglingSuperclass:
                return "DanglingSuperclass";
            case error_kind_t::kFieldLayoutMismatch:
                return "FieldLayoutMismatch";
            case error_kind_t::kUnknownClass:
                return "UnknownClass";
        }
        return "Unknown";
    }

    HprofError::HprofError(error_kind_t kind, const std::string &message) :
            std::runtime_error(message),
            kind_(kind) {}
}

thread_local static std::string error;

void set_heapgraph_error(const std::string &message) {
    error = message;
}

const char *get_heapgraph_error() {
    return error.c_str();
}

[[noreturn]] void fatal(heapgraph::error_kind_t kind, const std::string &message) {
    set_heapgraph_error(message);
    hgError("%s: %s", heapgraph::error_kind_name(kind), message.c_str());
    throw heapgraph::HprofError(kind, message);
}

[[noreturn]] void reject(heapgraph::error_kind_t kind, const std::string &message) {
    throw heapgraph::HprofError(kind, message);
}
