#include "include/symbol.h"

#include <sstream>

#include "errorha.h"
#include "macro.h"

namespace heapgraph::internal::symbol {

    bool is_valid_utf8(const uint8_t *data, size_t length) {
        size_t i = 0;
        while (i < length) {
            const uint8_t lead = data[i];
            size_t trailing;
            uint32_t code_point;
            if (lead < 0x80) {
                ++i;
                continue;
            } else if ((lead & 0xe0) == 0xc0) {
                trailing = 1;
                code_point = lead & 0x1f;
            } else if ((lead & 0xf0) == 0xe0) {
                trailing = 2;
                code_point = lead & 0x0f;
            } else if ((lead & 0xf8) == 0xf0) {
                trailing = 3;
                code_point = lead & 0x07;
            } else {
                return false;
            }
            if (length - i <= trailing) return false;
            for (size_t j = 1; j <= trailing; ++j) {
                const uint8_t next = data[i + j];
                if ((next & 0xc0) != 0x80) return false;
                code_point = (code_point << 6) | (next & 0x3f);
            }
            // Modified UTF-8 encodes NUL as C0 80.
            const bool encoded_nul = trailing == 1 && code_point == 0;
            if (!encoded_nul) {
                if (trailing == 1 && code_point < 0x80) return false;
                if (trailing == 2 && code_point < 0x800) return false;
                if (trailing == 3 && (code_point < 0x10000 || code_point > 0x10ffff)) return false;
            }
            i += trailing + 1;
        }
        return true;
    }

    void SymbolTable::AddString(string_id_t id, const uint8_t *data, size_t length) {
        if (!is_valid_utf8(data, length)) {
            std::stringstream error_builder;
            error_builder << "string " << id << " is not valid UTF-8";
            reject(error_kind_t::kInvalidSymbol, error_builder.str());
        }
        std::string value(reinterpret_cast<const char *>(data), length);
        if (!strings_.emplace(id, value).second) return;
        string_ids_[value].emplace_back(id);
    }

    void SymbolTable::AddLoadClass(const load_class_t &load_class) {
        load_classes_[load_class.class_id] = load_class;
        classes_by_name_id_[load_class.name_id] = load_class.class_id;
    }

    std::optional<std::string> SymbolTable::GetString(string_id_t id) const {
        const auto it = strings_.find(id);
        if (it == strings_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<string_id_t> SymbolTable::FindStringId(const std::string &value) const {
        const auto it = string_ids_.find(value);
        if (it == string_ids_.end()) return std::nullopt;
        return it->second.front();
    }

    std::optional<std::string> SymbolTable::GetClassName(object_id_t class_id) const {
        const load_class_t load_class = unwrap(GetLoadClass(class_id), return std::nullopt);
        return GetString(load_class.name_id);
    }

    std::optional<object_id_t> SymbolTable::FindClassByName(const std::string &class_name) const {
        const auto ids = string_ids_.find(class_name);
        if (ids == string_ids_.end()) return std::nullopt;
        // The same text may be dumped under several string ids.
        for (const auto name_id: ids->second) {
            const auto it = classes_by_name_id_.find(name_id);
            if (it != classes_by_name_id_.end()) return it->second;
        }
        return std::nullopt;
    }

    std::optional<load_class_t> SymbolTable::GetLoadClass(object_id_t class_id) const {
        const auto it = load_classes_.find(class_id);
        if (it == load_classes_.end()) return std::nullopt;
        return it->second;
    }
}
