#ifndef __heapgraph_sink_columnar_emitter_h__
#define __heapgraph_sink_columnar_emitter_h__

#include <map>
#include <string>
#include <vector>

#include "event.h"
#include "table_writer.h"

namespace heapgraph::sink {

    /**
     * Turns resolved objects into rows of per-class tables.
     * <p>
     * Instances go to a table named after their class ('/' replaced by '.'): an "id" column, then one column per
     * primitive field and two columns ("<field>.id", "<field>.type") per reference field. The first instance fixes the
     * schema of its table. Object arrays go to "object_arrays" and primitive arrays to "<type>_arrays". Rows are
     * buffered per table and handed to the writer every \a batch_rows rows, on Flush and on destruction.
     */
    class ColumnarEmitter {
    public:
        explicit ColumnarEmitter(TableWriter &writer, size_t batch_rows = 4096);

        ~ColumnarEmitter();

        void Handle(const event_t &event);

        void Flush();

        [[nodiscard]] size_t GetTableCount() const {
            return tables_.size();
        }

        [[nodiscard]] size_t GetDroppedRowCount() const {
            return dropped_rows_;
        }

        [[nodiscard]] static std::string GetTableName(const std::string &class_name);

    private:
        struct table_t {
            std::vector<column_t> schema;
            std::vector<row_t> rows;
        };

        void EmitInstance(const ResolvedObject &object);

        void EmitObjectArray(const ResolvedObject &object);

        void EmitPrimitiveArray(const ResolvedObject &object);

        void Append(const std::string &table_name, std::vector<column_t> &&schema, row_t &&row);

        void FlushTable(const std::string &table_name, table_t &table);

        TableWriter &writer_;
        const size_t batch_rows_;
        std::map<std::string, table_t> tables_;
        size_t dropped_rows_;
    };
}

#endif
