#ifndef __heapgraph_err_h__
#define __heapgraph_err_h__

#include <stdexcept>
#include <string>

namespace heapgraph {

    /**
     * Kinds of decode failures.
     * <p>
     * Fatal kinds leave the byte position undefined, so decoding cannot continue past them. The others are scoped to
     * one record or one object: the offending item is dropped and decoding goes on.
     */
    enum class error_kind_t {
        // fatal
        kTruncatedInput,
        kUnconsumedPayload,
        kInvalidHeader,
        kUnknownSubRecord,
        kInvalidValueType,
        // recoverable
        kUnknownTag,
        kInvalidSymbol,
        kDuplicateClassDef,
        kDanglingSuperclass,
        kFieldLayoutMismatch,
        kUnknownClass,
    };

    [[nodiscard]] bool is_fatal_error(error_kind_t kind);

    [[nodiscard]] const char *error_kind_name(error_kind_t kind);

    class HprofError : public std::runtime_error {
    public:
        HprofError(error_kind_t kind, const std::string &message);

        [[nodiscard]] error_kind_t GetKind() const {
            return kind_;
        }

        [[nodiscard]] bool IsFatal() const {
            return is_fatal_error(kind_);
        }

    private:
        error_kind_t kind_;
    };
}

void set_heapgraph_error(const std::string &message);

const char *get_heapgraph_error();

/**
 * Records \a message as the last error of the calling thread and throws a HprofError of \a kind.
 */
[[noreturn]] void fatal(heapgraph::error_kind_t kind, const std::string &message);

/**
 * Throws a HprofError of \a kind for a failure scoped to the current record or object. The last error is left
 * untouched.
 */
[[noreturn]] void reject(heapgraph::error_kind_t kind, const std::string &message);

#endif
