#ifndef __heapgraph_sink_table_writer_h__
#define __heapgraph_sink_table_writer_h__

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace heapgraph::sink {

    enum class column_type_t {
        kUInt64,
        kBoolean,
        kInt8,
        kUInt16,
        kInt16,
        kInt32,
        kInt64,
        kFloat32,
        kFloat64,
        kUtf8,
        kList,
    };

    [[nodiscard]] const char *column_type_name(column_type_t type);

    struct column_t {
        std::string name;
        column_type_t type;
        // Type of the items of a kList column.
        column_type_t element_type = column_type_t::kUtf8;

        bool operator==(const column_t &) const = default;
    };

    /**
     * One scalar cell. Signed columns hold int64_t, kUInt64 and kUInt16 hold uint64_t, float columns hold double.
     * std::monostate is a null cell.
     */
    typedef std::variant<std::monostate, bool, int64_t, uint64_t, double, std::string> scalar_t;

    typedef std::vector<scalar_t> list_t;

    typedef std::variant<scalar_t, list_t> cell_t;

    typedef std::vector<cell_t> row_t;

    /**
     * Destination of buffered columnar rows. Every row of one table shares the schema passed with its first batch.
     */
    class TableWriter {
    public:
        virtual ~TableWriter() = default;

        virtual void Write(const std::string &table, const std::vector<column_t> &schema,
                           const std::vector<row_t> &rows) = 0;
    };

    /**
     * Writes each table to "<directory>/<table>.parquet", SNAPPY compressed, one row group per batch.
     * <p>
     * A table file is created (or truncated) the first time this writer sees the table and stays open until Close or
     * destruction, which write the file footers.
     */
    class ParquetTableWriter final : public TableWriter {
    public:
        explicit ParquetTableWriter(std::string directory);

        ~ParquetTableWriter() override;

        void Write(const std::string &table, const std::vector<column_t> &schema,
                   const std::vector<row_t> &rows) override;

        void Close();

    private:
        struct open_table_t;

        const std::string directory_;
        std::map<std::string, std::unique_ptr<open_table_t>> tables_;
    };
}

#endif
