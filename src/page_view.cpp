#include "page_view.h"
#include "loguru.hpp"
#include <algorithm>
#include <cctype>

static std::string toLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

PageView::PageView(const ResultAccumulator& source, int page_size)
    : m_source(source), m_pageSize(std::max(1, page_size))
{
    rebuild();
}

bool PageView::keyMatches(const std::string& key, const std::string& lowered_query) {
    if (lowered_query.empty()) return true;
    auto it = std::search(key.begin(), key.end(), lowered_query.begin(), lowered_query.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) == b;
                          });
    return it != key.end();
}

void PageView::setPageSize(int n) {
    if (n <= 0) {
        LOG_F(WARNING, "PageView: ignoring page size %d", n);
        return;
    }
    if (n == m_pageSize) return;
    // Keep the first visible record on screen
    size_t firstVisible = pageStartIndex();
    m_pageSize = n;
    m_currentPage = static_cast<int>(firstVisible / static_cast<size_t>(n)) + 1;
    recompute();
}

void PageView::setFilter(const std::string& query) {
    if (query == m_filter) return;
    m_filter = query;
    m_loweredFilter = toLower(query);
    m_currentPage = 1;
    rebuild();
}

void PageView::clearFilter() {
    setFilter("");
}

void PageView::goToPage(int k) {
    m_currentPage = k;
    recompute();
}

void PageView::recompute() {
    if (m_scannedRevision != m_source.revision() || m_scannedCount > m_source.count()) {
        rebuild();
        return;
    }
    if (m_scannedCount < m_source.count()) {
        scanFrom(m_scannedCount);
    }
    clampPage();
}

void PageView::rebuild() {
    m_filtered.clear();
    m_scannedRevision = m_source.revision();
    scanFrom(0);
    clampPage();
}

void PageView::scanFrom(size_t start) {
    const auto& records = m_source.all();
    if (m_loweredFilter.empty()) {
        m_filtered.reserve(records.size());
        for (size_t i = start; i < records.size(); ++i) {
            m_filtered.push_back(i);
        }
    } else {
        for (size_t i = start; i < records.size(); ++i) {
            if (keyMatches(records[i].key, m_loweredFilter)) {
                m_filtered.push_back(i);
            }
        }
    }
    m_scannedCount = records.size();
}

void PageView::clampPage() {
    size_t size = static_cast<size_t>(m_pageSize);
    size_t pages = (m_filtered.size() + size - 1) / size;
    m_totalPages = std::max(1, static_cast<int>(pages));
    m_currentPage = std::clamp(m_currentPage, 1, m_totalPages);
}

size_t PageView::pageStartIndex() const {
    return static_cast<size_t>(m_currentPage - 1) * static_cast<size_t>(m_pageSize);
}

ObjectRecords PageView::currentPageRecords() const {
    ObjectRecords page;
    const auto& records = m_source.all();
    size_t start = pageStartIndex();
    size_t end = std::min(start + static_cast<size_t>(m_pageSize), m_filtered.size());
    if (start >= end) return page;

    page.reserve(end - start);
    for (size_t i = start; i < end; ++i) {
        size_t idx = m_filtered[i];
        if (idx < records.size()) {
            page.push_back(records[idx]);
        }
    }
    return page;
}
