#pragma once

#include "result_accumulator.h"
#include <string>
#include <vector>
#include <cstddef>

// Fixed-size, 1-indexed pages over a ResultAccumulator, optionally filtered
// by a case-insensitive literal substring of the key.
//
// The view caches the indices that pass the filter. Appends to the
// accumulator are scanned incrementally; a replaceAll, a filter change or a
// page size change rebuilds the cache.
class PageView {
public:
    static constexpr int kDefaultPageSize = 1000;

    explicit PageView(const ResultAccumulator& source, int page_size = kDefaultPageSize);

    void setPageSize(int n);
    void setFilter(const std::string& query);
    void clearFilter();
    void goToPage(int k);

    void firstPage() { goToPage(1); }
    void prevPage() { goToPage(m_currentPage - 1); }
    void nextPage() { goToPage(m_currentPage + 1); }
    void lastPage() { goToPage(totalPages()); }

    // Re-derive pagination from the accumulator's current contents
    void recompute();

    ObjectRecords currentPageRecords() const;
    int totalPages() const { return m_totalPages; }
    int currentPage() const { return m_currentPage; }
    int pageSize() const { return m_pageSize; }
    size_t filteredCount() const { return m_filtered.size(); }
    const std::string& filter() const { return m_filter; }
    bool hasFilter() const { return !m_filter.empty(); }

    // Zero-based index of the first record of the current page within the
    // filtered sequence
    size_t pageStartIndex() const;

    // Case-insensitive literal containment
    static bool keyMatches(const std::string& key, const std::string& lowered_query);

private:
    void rebuild();
    void scanFrom(size_t start);
    void clampPage();

    const ResultAccumulator& m_source;
    int m_pageSize;
    int m_currentPage = 1;
    int m_totalPages = 1;
    std::string m_filter;
    std::string m_loweredFilter;

    std::vector<size_t> m_filtered;     // indices into m_source.all()
    size_t m_scannedCount = 0;
    uint64_t m_scannedRevision = 0;
};
