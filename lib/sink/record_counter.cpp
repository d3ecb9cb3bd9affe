#include "include/record_counter.h"

#include <algorithm>

namespace heapgraph::sink {

    RecordCounter::RecordCounter() {
        for (const auto tag: kRecordTags) {
            counts_[tag] = 0;
        }
    }

    void RecordCounter::Handle(const event_t &event) {
        if (const auto *counted = std::get_if<RecordCounted>(&event)) {
            ++counts_[counted->tag];
        }
    }

    std::vector<std::pair<record_tag_t, uint64_t>> RecordCounter::GetCounts() const {
        std::vector<std::pair<record_tag_t, uint64_t>> result;
        for (const auto tag: kRecordTags) {
            result.emplace_back(tag, counts_.at(tag));
        }
        std::stable_sort(result.begin(), result.end(), [](const auto &lhs, const auto &rhs) {
            return lhs.second > rhs.second;
        });
        return result;
    }

    void RecordCounter::Print(std::ostream &out) const {
        for (const auto &[tag, count]: GetCounts()) {
            out << record_tag_name(tag) << ": " << count << "\n";
        }
    }
}
