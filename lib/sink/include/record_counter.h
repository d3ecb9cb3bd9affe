#ifndef __heapgraph_sink_record_counter_h__
#define __heapgraph_sink_record_counter_h__

#include <map>
#include <ostream>
#include <utility>
#include <vector>

#include "event.h"

namespace heapgraph::sink {

    /**
     * Counts top-level records per tag. Every known tag starts at zero.
     */
    class RecordCounter {
    public:
        RecordCounter();

        void Handle(const event_t &event);

        /**
         * Returns the counts of all known tags, highest first. Equal counts keep tag declaration order.
         */
        [[nodiscard]] std::vector<std::pair<record_tag_t, uint64_t>> GetCounts() const;

        /**
         * Prints one "Tag: count" line per known tag in GetCounts order.
         */
        void Print(std::ostream &out) const;

    private:
        std::map<record_tag_t, uint64_t> counts_;
    };
}

#endif
