#pragma once

#include "backend.h"
#include "result_accumulator.h"
#include "page_view.h"
#include <string>
#include <memory>

// Pages added per "load more" step
constexpr int kPageBatchSize = 10;

// The "show load more" heuristic: the run stopped on a positive multiple of
// the batch size and every page it fetched was full. This suggests, but does
// not guarantee, that the store holds more objects.
bool shouldOfferLoadMore(int pages_processed, int full_pages, int batch_size = kPageBatchSize);

enum class ListingStatus {
    Idle,
    Listing,
    Retrying,
    Completed,
    Failed,
    Cancelled,
};

const char* listingStatusName(ListingStatus status);

// The listing model - owns the accumulated results and the page view, and
// applies backend events to them. All methods run on the consumer thread.
class ListingModel {
public:
    ListingModel();
    ~ListingModel();

    // Initialize with a backend
    void setBackend(std::unique_ptr<IBackend> backend);

    // Commands (call from UI thread)
    void connect(const ConnectionConfig& config, int max_pages, int max_retries);
    void cancel();
    bool loadMore(int batches = 1);

    // Call once per frame to process pending events from backend
    // Returns true if any events were processed (UI should redraw)
    bool processEvents();

    // State accessors (call from UI thread after processEvents)
    ListingStatus status() const { return m_status; }
    bool isBusy() const { return m_status == ListingStatus::Listing || m_status == ListingStatus::Retrying; }
    const std::string& statusText() const { return m_statusText; }
    const std::string& errorText() const { return m_errorText; }
    bool canLoadMore() const;

    const ResultAccumulator& results() const { return m_results; }
    PageView& view() { return m_view; }
    const PageView& view() const { return m_view; }

    SessionHandle session() const { return m_session; }
    int generation() const { return m_generation; }
    const ConnectionConfig& connection() const { return m_config; }

    // Statistics of the last finished run
    int pagesProcessed() const { return m_pagesProcessed; }
    size_t totalFound() const { return m_totalFound; }
    bool stoppedAtLimit() const { return m_stoppedAtLimit; }
    int lastAttempt() const { return m_lastAttempt; }

private:
    void resetRunState();
    void applyEvent(StateEvent& event);

    std::unique_ptr<IBackend> m_backend;
    ResultAccumulator m_results;
    PageView m_view;

    ConnectionConfig m_config;
    SessionHandle m_session = kInvalidSession;
    int m_generation = 0;

    ListingStatus m_status = ListingStatus::Idle;
    std::string m_statusText;
    std::string m_errorText;

    // Current run
    int m_fullPages = 0;
    int m_lastAttempt = 0;

    // Last completed run
    int m_pagesProcessed = 0;
    size_t m_totalFound = 0;
    bool m_stoppedAtLimit = false;
};
