#include "include/columnar_emitter.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "logger.h"

namespace heapgraph::sink {

    static constexpr const char *kMissingUtf8 = "(missing utf8)";
    static constexpr const char *kObjectArraysTable = "object_arrays";

    static column_type_t get_column_type(value_type_t type) {
        switch (type) {
            case value_type_t::kObject:
                return column_type_t::kUInt64;
            case value_type_t::kBoolean:
                return column_type_t::kBoolean;
            case value_type_t::kChar:
                return column_type_t::kUInt16;
            case value_type_t::kFloat:
                return column_type_t::kFloat32;
            case value_type_t::kDouble:
                return column_type_t::kFloat64;
            case value_type_t::kByte:
                return column_type_t::kInt8;
            case value_type_t::kShort:
                return column_type_t::kInt16;
            case value_type_t::kInt:
                return column_type_t::kInt32;
            case value_type_t::kLong:
                return column_type_t::kInt64;
        }
        return column_type_t::kUtf8;
    }

    static scalar_t to_scalar(const Value &value) {
        switch (value.GetType()) {
            case value_type_t::kObject:
                return value.AsObjectId();
            case value_type_t::kBoolean:
                return value.AsBoolean();
            case value_type_t::kChar:
                return static_cast<uint64_t>(value.AsChar());
            case value_type_t::kFloat:
                return static_cast<double>(value.AsFloat());
            case value_type_t::kDouble:
                return value.AsDouble();
            case value_type_t::kByte:
                return static_cast<int64_t>(value.AsByte());
            case value_type_t::kShort:
                return static_cast<int64_t>(value.AsShort());
            case value_type_t::kInt:
                return static_cast<int64_t>(value.AsInt());
            case value_type_t::kLong:
                return value.AsLong();
        }
        return std::monostate();
    }

    static scalar_t to_scalar(const std::optional<std::string> &text) {
        if (!text.has_value()) return std::monostate();
        return text.value();
    }

    ColumnarEmitter::ColumnarEmitter(TableWriter &writer, size_t batch_rows) :
            writer_(writer),
            batch_rows_(std::max<size_t>(batch_rows, 1)),
            tables_(),
            dropped_rows_(0) {}

    ColumnarEmitter::~ColumnarEmitter() {
        try {
            Flush();
        } catch (const std::exception &e) {
            hgError("failed to flush buffered rows: %s", e.what());
        }
    }

    std::string ColumnarEmitter::GetTableName(const std::string &class_name) {
        std::string table_name = class_name;
        std::replace(table_name.begin(), table_name.end(), '/', '.');
        return table_name;
    }

    void ColumnarEmitter::Handle(const event_t &event) {
        const auto *object_resolved = std::get_if<ObjectResolved>(&event);
        if (object_resolved == nullptr) return;
        const ResolvedObject &object = object_resolved->object;
        switch (object.kind) {
            case object_kind_t::kInstance:
                EmitInstance(object);
                break;
            case object_kind_t::kObjectArray:
                EmitObjectArray(object);
                break;
            case object_kind_t::kPrimitiveArray:
                EmitPrimitiveArray(object);
                break;
        }
    }

    void ColumnarEmitter::EmitInstance(const ResolvedObject &object) {
        std::vector<column_t> schema{{.name = "id", .type = column_type_t::kUInt64}};
        row_t row{scalar_t(object.id)};
        for (const auto &field: object.fields) {
            const std::string name = field.name.value_or(kMissingUtf8);
            if (field.value.IsReference()) {
                schema.emplace_back(column_t{.name = name + ".id", .type = column_type_t::kUInt64});
                schema.emplace_back(column_t{.name = name + ".type", .type = column_type_t::kUtf8});
                row.emplace_back(scalar_t(field.value.AsObjectId()));
                row.emplace_back(to_scalar(field.referent_type));
            } else {
                schema.emplace_back(column_t{.name = name, .type = get_column_type(field.value.GetType())});
                row.emplace_back(to_scalar(field.value));
            }
        }
        Append(GetTableName(object.class_name.value_or(std::to_string(object.class_id))), std::move(schema),
               std::move(row));
    }

    void ColumnarEmitter::EmitObjectArray(const ResolvedObject &object) {
        list_t elements;
        elements.reserve(object.references.size());
        for (const auto &element: object.references) {
            if (element.IsNull()) {
                elements.emplace_back(std::monostate());
            } else {
                elements.emplace_back(std::to_string(element.id) + ":" + element.referent_type.value_or(""));
            }
        }
        Append(kObjectArraysTable,
               {
                       {.name = "id", .type = column_type_t::kUInt64},
                       {.name = "class", .type = column_type_t::kUtf8},
                       {.name = "elements", .type = column_type_t::kList, .element_type = column_type_t::kUtf8},
               },
               {
                       scalar_t(object.id),
                       scalar_t(GetTableName(object.class_name.value_or(""))),
                       std::move(elements),
               });
    }

    void ColumnarEmitter::EmitPrimitiveArray(const ResolvedObject &object) {
        list_t values;
        values.reserve(object.elements.size());
        for (const auto &element: object.elements) {
            values.emplace_back(to_scalar(element));
        }
        Append(std::string(java_type_name(object.element_type)) + "_arrays",
               {
                       {.name = "id", .type = column_type_t::kUInt64},
                       {.name = "values", .type = column_type_t::kList,
                               .element_type = get_column_type(object.element_type)},
               },
               {
                       scalar_t(object.id),
                       std::move(values),
               });
    }

    void ColumnarEmitter::Append(const std::string &table_name, std::vector<column_t> &&schema, row_t &&row) {
        auto it = tables_.find(table_name);
        if (it == tables_.end()) {
            it = tables_.emplace(table_name, table_t{.schema = std::move(schema), .rows = {}}).first;
        } else if (it->second.schema != schema) {
            hgWarn("row with a different schema dropped from table %s", table_name.c_str());
            ++dropped_rows_;
            return;
        }
        table_t &table = it->second;
        table.rows.emplace_back(std::move(row));
        if (table.rows.size() >= batch_rows_) {
            FlushTable(table_name, table);
        }
    }

    void ColumnarEmitter::FlushTable(const std::string &table_name, table_t &table) {
        if (table.rows.empty()) return;
        writer_.Write(table_name, table.schema, table.rows);
        table.rows.clear();
    }

    void ColumnarEmitter::Flush() {
        for (auto &[table_name, table]: tables_) {
            FlushTable(table_name, table);
        }
    }
}
