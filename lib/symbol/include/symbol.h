#ifndef __heapgraph_symbol_h__
#define __heapgraph_symbol_h__

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "value.h"

namespace heapgraph::internal::symbol {

    /**
     * Checks \a data as UTF-8 in the JVM modified form: the two-byte encoding of NUL and separately encoded surrogate
     * halves are allowed, overlong forms and stray continuation bytes are not.
     */
    [[nodiscard]] bool is_valid_utf8(const uint8_t *data, size_t length);

    struct load_class_t {
        uint32_t class_serial;
        object_id_t class_id;
        uint32_t stack_trace_serial;
        string_id_t name_id;
    };

    /**
     * Strings and class names collected from UTF8 and LOAD_CLASS records.
     * <p>
     * Class name queries may arrive before the binding LOAD_CLASS record; they return std::nullopt until it is seen.
     */
    class SymbolTable {
    public:
        /**
         * Adds the string record \a id. Fails with InvalidSymbol if \a data is not UTF-8; the record is not added.
         */
        void AddString(string_id_t id, const uint8_t *data, size_t length);

        void AddLoadClass(const load_class_t &load_class);

        [[nodiscard]] std::optional<std::string> GetString(string_id_t id) const;

        /**
         * Returns the first string id seen with text \a value.
         */
        [[nodiscard]] std::optional<string_id_t> FindStringId(const std::string &value) const;

        [[nodiscard]] std::optional<std::string> GetClassName(object_id_t class_id) const;

        [[nodiscard]] std::optional<object_id_t> FindClassByName(const std::string &class_name) const;

        [[nodiscard]] std::optional<load_class_t> GetLoadClass(object_id_t class_id) const;

        [[nodiscard]] size_t GetStringCount() const {
            return strings_.size();
        }

    private:
        std::unordered_map<string_id_t, std::string> strings_;
        // String ids by text, in the order the records were seen.
        std::unordered_map<std::string, std::vector<string_id_t>> string_ids_;
        std::unordered_map<object_id_t, load_class_t> load_classes_;
        std::unordered_map<string_id_t, object_id_t> classes_by_name_id_;
    };
}

#endif
