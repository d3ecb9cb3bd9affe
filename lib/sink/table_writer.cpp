#include "include/table_writer.h"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>
#include <parquet/exception.h>
#include <parquet/properties.h>

#include <stdexcept>
#include <utility>

#include "logger.h"

namespace heapgraph::sink {

    const char *column_type_name(column_type_t type) {
        switch (type) {
            case column_type_t::kUInt64:
                return "uint64";
            case column_type_t::kBoolean:
                return "boolean";
            case column_type_t::kInt8:
                return "int8";
            case column_type_t::kUInt16:
                return "uint16";
            case column_type_t::kInt16:
                return "int16";
            case column_type_t::kInt32:
                return "int32";
            case column_type_t::kInt64:
                return "int64";
            case column_type_t::kFloat32:
                return "float32";
            case column_type_t::kFloat64:
                return "float64";
            case column_type_t::kUtf8:
                return "utf8";
            case column_type_t::kList:
                return "list";
        }
        return "unknown";
    }

    struct ParquetTableWriter::open_table_t {
        std::vector<column_t> columns;
        std::shared_ptr<arrow::Schema> schema;
        std::shared_ptr<arrow::io::FileOutputStream> sink;
        std::unique_ptr<parquet::arrow::FileWriter> writer;
    };

    static std::shared_ptr<arrow::DataType> get_scalar_arrow_type(column_type_t type) {
        switch (type) {
            case column_type_t::kUInt64:
                return arrow::uint64();
            case column_type_t::kBoolean:
                return arrow::boolean();
            case column_type_t::kInt8:
                return arrow::int8();
            case column_type_t::kUInt16:
                return arrow::uint16();
            case column_type_t::kInt16:
                return arrow::int16();
            case column_type_t::kInt32:
                return arrow::int32();
            case column_type_t::kInt64:
                return arrow::int64();
            case column_type_t::kFloat32:
                return arrow::float32();
            case column_type_t::kFloat64:
                return arrow::float64();
            case column_type_t::kUtf8:
                return arrow::utf8();
            case column_type_t::kList:
                break;
        }
        throw std::invalid_argument("Lists of lists are not supported.");
    }

    static std::shared_ptr<arrow::DataType> get_arrow_type(const column_t &column) {
        if (column.type == column_type_t::kList) return arrow::list(get_scalar_arrow_type(column.element_type));
        return get_scalar_arrow_type(column.type);
    }

    static std::shared_ptr<arrow::ArrayBuilder> make_builder(const column_t &column) {
        arrow::MemoryPool *pool = arrow::default_memory_pool();
        switch (column.type) {
            case column_type_t::kUInt64:
                return std::make_shared<arrow::UInt64Builder>(pool);
            case column_type_t::kBoolean:
                return std::make_shared<arrow::BooleanBuilder>(pool);
            case column_type_t::kInt8:
                return std::make_shared<arrow::Int8Builder>(pool);
            case column_type_t::kUInt16:
                return std::make_shared<arrow::UInt16Builder>(pool);
            case column_type_t::kInt16:
                return std::make_shared<arrow::Int16Builder>(pool);
            case column_type_t::kInt32:
                return std::make_shared<arrow::Int32Builder>(pool);
            case column_type_t::kInt64:
                return std::make_shared<arrow::Int64Builder>(pool);
            case column_type_t::kFloat32:
                return std::make_shared<arrow::FloatBuilder>(pool);
            case column_type_t::kFloat64:
                return std::make_shared<arrow::DoubleBuilder>(pool);
            case column_type_t::kUtf8:
                return std::make_shared<arrow::StringBuilder>(pool);
            case column_type_t::kList:
                return std::make_shared<arrow::ListBuilder>(
                        pool, make_builder(column_t{.name = column.name, .type = column.element_type}),
                        get_arrow_type(column));
        }
        throw std::invalid_argument("Unknown column type.");
    }

    static void append_scalar(arrow::ArrayBuilder *builder, column_type_t type, const scalar_t &value) {
        if (std::holds_alternative<std::monostate>(value)) {
            PARQUET_THROW_NOT_OK(builder->AppendNull());
            return;
        }
        arrow::Status status;
        switch (type) {
            case column_type_t::kUInt64:
                status = static_cast<arrow::UInt64Builder *>(builder)->Append(std::get<uint64_t>(value));
                break;
            case column_type_t::kBoolean:
                status = static_cast<arrow::BooleanBuilder *>(builder)->Append(std::get<bool>(value));
                break;
            case column_type_t::kInt8:
                status = static_cast<arrow::Int8Builder *>(builder)->Append(
                        static_cast<int8_t>(std::get<int64_t>(value)));
                break;
            case column_type_t::kUInt16:
                status = static_cast<arrow::UInt16Builder *>(builder)->Append(
                        static_cast<uint16_t>(std::get<uint64_t>(value)));
                break;
            case column_type_t::kInt16:
                status = static_cast<arrow::Int16Builder *>(builder)->Append(
                        static_cast<int16_t>(std::get<int64_t>(value)));
                break;
            case column_type_t::kInt32:
                status = static_cast<arrow::Int32Builder *>(builder)->Append(
                        static_cast<int32_t>(std::get<int64_t>(value)));
                break;
            case column_type_t::kInt64:
                status = static_cast<arrow::Int64Builder *>(builder)->Append(std::get<int64_t>(value));
                break;
            case column_type_t::kFloat32:
                status = static_cast<arrow::FloatBuilder *>(builder)->Append(
                        static_cast<float>(std::get<double>(value)));
                break;
            case column_type_t::kFloat64:
                status = static_cast<arrow::DoubleBuilder *>(builder)->Append(std::get<double>(value));
                break;
            case column_type_t::kUtf8:
                status = static_cast<arrow::StringBuilder *>(builder)->Append(std::get<std::string>(value));
                break;
            case column_type_t::kList:
                throw std::invalid_argument("Lists of lists are not supported.");
        }
        PARQUET_THROW_NOT_OK(status);
    }

    static void append_cell(arrow::ArrayBuilder *builder, const column_t &column, const cell_t &cell) {
        if (column.type != column_type_t::kList) {
            append_scalar(builder, column.type, std::get<scalar_t>(cell));
            return;
        }
        auto *list_builder = static_cast<arrow::ListBuilder *>(builder);
        PARQUET_THROW_NOT_OK(list_builder->Append());
        for (const auto &item: std::get<list_t>(cell)) {
            append_scalar(list_builder->value_builder(), column.element_type, item);
        }
    }

    ParquetTableWriter::ParquetTableWriter(std::string directory) : directory_(std::move(directory)) {}

    ParquetTableWriter::~ParquetTableWriter() {
        try {
            Close();
        } catch (const std::exception &e) {
            hgError("failed to close parquet tables under %s: %s", directory_.c_str(), e.what());
        }
    }

    void ParquetTableWriter::Write(const std::string &table, const std::vector<column_t> &schema,
                                   const std::vector<row_t> &rows) {
        auto it = tables_.find(table);
        if (it == tables_.end()) {
            auto open_table = std::make_unique<open_table_t>();
            open_table->columns = schema;
            std::vector<std::shared_ptr<arrow::Field>> fields;
            for (const auto &column: schema) {
                fields.emplace_back(arrow::field(column.name, get_arrow_type(column)));
            }
            open_table->schema = arrow::schema(fields);

            const std::string path = directory_ + "/" + table + ".parquet";
            PARQUET_ASSIGN_OR_THROW(open_table->sink, arrow::io::FileOutputStream::Open(path));
            const std::shared_ptr<parquet::WriterProperties> properties =
                    parquet::WriterProperties::Builder().compression(arrow::Compression::SNAPPY)->build();
            PARQUET_ASSIGN_OR_THROW(open_table->writer,
                                    parquet::arrow::FileWriter::Open(*open_table->schema, arrow::default_memory_pool(),
                                                                     open_table->sink, properties));
            hgDebug("created table %s with %zu columns", path.c_str(), schema.size());
            it = tables_.emplace(table, std::move(open_table)).first;
        } else if (it->second->columns != schema) {
            throw std::invalid_argument("Schema of table " + table + " changed between batches.");
        }
        if (rows.empty()) return;

        open_table_t &open_table = *it->second;
        std::vector<std::shared_ptr<arrow::ArrayBuilder>> builders;
        for (const auto &column: schema) {
            builders.emplace_back(make_builder(column));
        }
        for (const auto &row: rows) {
            if (row.size() != schema.size()) {
                throw std::invalid_argument("Row of table " + table + " has " + std::to_string(row.size()) +
                                            " cells, expected " + std::to_string(schema.size()) + ".");
            }
            for (size_t i = 0; i < row.size(); ++i) {
                try {
                    append_cell(builders[i].get(), schema[i], row[i]);
                } catch (const std::bad_variant_access &) {
                    throw std::invalid_argument("Cell of column " + schema[i].name + " in table " + table +
                                                " does not match the column type.");
                }
            }
        }
        std::vector<std::shared_ptr<arrow::Array>> arrays(builders.size());
        for (size_t i = 0; i < builders.size(); ++i) {
            PARQUET_THROW_NOT_OK(builders[i]->Finish(&arrays[i]));
        }
        const std::shared_ptr<arrow::Table> batch =
                arrow::Table::Make(open_table.schema, arrays, static_cast<int64_t>(rows.size()));
        PARQUET_THROW_NOT_OK(open_table.writer->WriteTable(*batch, static_cast<int64_t>(rows.size())));
    }

    void ParquetTableWriter::Close() {
        std::map<std::string, std::unique_ptr<open_table_t>> tables = std::move(tables_);
        tables_.clear();
        std::string failure;
        for (auto &[name, table]: tables) {
            arrow::Status status = table->writer->Close();
            if (status.ok()) status = table->sink->Close();
            if (!status.ok() && failure.empty()) {
                failure = "Failed to close table " + name + ": " + status.ToString();
            }
        }
        if (!failure.empty()) {
            throw std::runtime_error(failure);
        }
    }
}
