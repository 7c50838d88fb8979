#pragma once

#include "object_record.h"
#include <cstddef>
#include <cstdint>

// Ordered collection of every record seen on one connection.
// Append-only within a run; replaced wholesale by a superseding run.
// Owned and mutated by the consumer thread only. No deduplication.
class ResultAccumulator {
public:
    void append(const ObjectRecords& records);
    void append(ObjectRecords&& records);
    void replaceAll(ObjectRecords records);
    void clear();

    const ObjectRecords& all() const { return m_records; }
    size_t count() const { return m_records.size(); }

    // Bumped on replaceAll/clear; views use it to detect non-append changes
    uint64_t revision() const { return m_revision; }

private:
    ObjectRecords m_records;
    uint64_t m_revision = 0;
};
