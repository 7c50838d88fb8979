#include "result_accumulator.h"
#include "loguru.hpp"
#include <iterator>

void ResultAccumulator::append(const ObjectRecords& records) {
    m_records.insert(m_records.end(), records.begin(), records.end());
}

void ResultAccumulator::append(ObjectRecords&& records) {
    if (m_records.empty()) {
        m_records = std::move(records);
        return;
    }
    m_records.insert(m_records.end(),
                     std::make_move_iterator(records.begin()),
                     std::make_move_iterator(records.end()));
}

void ResultAccumulator::replaceAll(ObjectRecords records) {
    if (records.size() < m_records.size()) {
        LOG_F(WARNING, "ResultAccumulator: superseding set is smaller (%zu < %zu)",
              records.size(), m_records.size());
    }
    m_records = std::move(records);
    ++m_revision;
}

void ResultAccumulator::clear() {
    m_records.clear();
    ++m_revision;
}
