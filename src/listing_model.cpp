#include "listing_model.h"
#include "loguru.hpp"

bool shouldOfferLoadMore(int pages_processed, int full_pages, int batch_size) {
    if (batch_size <= 0 || pages_processed <= 0) return false;
    return pages_processed % batch_size == 0 && full_pages == pages_processed;
}

const char* listingStatusName(ListingStatus status) {
    switch (status) {
        case ListingStatus::Idle: return "Idle";
        case ListingStatus::Listing: return "Listing";
        case ListingStatus::Retrying: return "Retrying";
        case ListingStatus::Completed: return "Completed";
        case ListingStatus::Failed: return "Failed";
        case ListingStatus::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

ListingModel::ListingModel()
    : m_view(m_results)
{
}

ListingModel::~ListingModel() {
    if (m_backend && m_session != kInvalidSession) {
        m_backend->release(m_session);
    }
}

void ListingModel::setBackend(std::unique_ptr<IBackend> backend) {
    LOG_F(INFO, "Setting backend");
    m_backend = std::move(backend);
}

void ListingModel::resetRunState() {
    m_fullPages = 0;
    m_lastAttempt = 1;
    m_errorText.clear();
}

void ListingModel::connect(const ConnectionConfig& config, int max_pages, int max_retries) {
    if (!m_backend) {
        LOG_F(WARNING, "connect: no backend");
        return;
    }

    if (m_session != kInvalidSession) {
        LOG_F(INFO, "Releasing previous connection handle=%llu",
              static_cast<unsigned long long>(m_session));
        m_backend->release(m_session);
    }

    LOG_F(INFO, "Connecting: endpoint=%s bucket=%s prefix=%s maxPages=%d maxRetries=%d",
          config.endpoint_url.empty() ? "(aws)" : config.endpoint_url.c_str(),
          config.bucket.c_str(), config.prefix.c_str(), max_pages, max_retries);

    m_config = config;
    m_results.clear();
    m_view.recompute();
    resetRunState();
    m_pagesProcessed = 0;
    m_totalFound = 0;
    m_stoppedAtLimit = false;

    m_session = m_backend->startListing(config, max_pages, max_retries);
    m_generation = m_backend->generation(m_session);
    m_status = ListingStatus::Listing;
    m_statusText = "Connecting to S3...";
}

void ListingModel::cancel() {
    if (!m_backend || m_session == kInvalidSession || !isBusy()) return;

    LOG_F(INFO, "Cancelling listing handle=%llu (keeping %zu objects)",
          static_cast<unsigned long long>(m_session), m_results.count());
    m_backend->cancel(m_session);
    m_status = ListingStatus::Cancelled;
    m_statusText = "Cancelled (" + std::to_string(m_results.count()) + " objects loaded)";
}

bool ListingModel::canLoadMore() const {
    if (m_status != ListingStatus::Completed) return false;
    return shouldOfferLoadMore(m_pagesProcessed, m_fullPages);
}

bool ListingModel::loadMore(int batches) {
    if (!m_backend || m_session == kInvalidSession || batches <= 0) return false;

    int additional = batches * kPageBatchSize;
    LOG_F(INFO, "Loading more: handle=%llu additionalPages=%d",
          static_cast<unsigned long long>(m_session), additional);
    if (!m_backend->loadMore(m_session, additional)) {
        return false;
    }
    m_generation = m_backend->generation(m_session);
    resetRunState();
    m_status = ListingStatus::Listing;
    m_statusText = "Loading more objects...";
    return true;
}

bool ListingModel::processEvents() {
    if (!m_backend) return false;

    auto events = m_backend->takeEvents();
    if (events.empty()) return false;

    for (auto& event : events) {
        if (event.session != m_session || event.generation != m_generation) {
            LOG_F(1, "Event: dropping stale %s handle=%llu generation=%d",
                  eventTypeName(event.type),
                  static_cast<unsigned long long>(event.session), event.generation);
            continue;
        }
        // A cancelled run stays cancelled even if events were already queued
        if (m_status == ListingStatus::Cancelled) continue;
        applyEvent(event);
    }
    return true;
}

void ListingModel::applyEvent(StateEvent& event) {
    switch (event.type) {
        case EventType::PageReady: {
            auto& payload = std::get<PageReadyPayload>(event.payload);
            LOG_F(INFO, "Event: PageReady page=%d count=%zu total=%zu last=%d",
                  payload.page_number, payload.records_in_page,
                  payload.total_so_far, payload.is_last_page);
            if (static_cast<int>(payload.records_in_page) == m_config.page_capacity) {
                m_fullPages += 1;
            }
            if (m_generation == 0) {
                m_results.append(std::move(payload.records));
                m_view.recompute();
            }
            // A load-more run re-enumerates from the start; its records land
            // with Completed
            m_status = ListingStatus::Listing;
            break;
        }
        case EventType::RetryAttempt: {
            auto& payload = std::get<RetryAttemptPayload>(event.payload);
            LOG_F(WARNING, "Event: RetryAttempt attempt=%d/%d error=%s",
                  payload.attempt, payload.max_attempts, payload.error_message.c_str());
            m_status = ListingStatus::Retrying;
            m_lastAttempt = payload.attempt + 1;
            m_statusText = "Attempt " + std::to_string(payload.attempt) + "/" +
                           std::to_string(payload.max_attempts) + " failed: " +
                           payload.error_message + " Retrying...";
            break;
        }
        case EventType::MaxRetriesExceeded: {
            auto& payload = std::get<MaxRetriesExceededPayload>(event.payload);
            LOG_F(WARNING, "Event: MaxRetriesExceeded attempts=%d error=%s",
                  payload.total_attempts, payload.final_error.c_str());
            m_status = ListingStatus::Failed;
            m_lastAttempt = payload.total_attempts;
            m_errorText = payload.final_error + " (after " +
                          std::to_string(payload.total_attempts) + " attempts)";
            m_statusText = m_errorText;
            break;
        }
        case EventType::Completed: {
            auto& payload = std::get<CompletedPayload>(event.payload);
            LOG_F(INFO, "Event: Completed pages=%d total=%zu stoppedAtLimit=%d",
                  payload.pages_processed, payload.total_found, payload.stopped_at_limit);
            if (m_generation > 0 || m_results.count() != payload.total_found) {
                m_results.replaceAll(std::move(payload.all_records));
            }
            m_view.recompute();
            m_pagesProcessed = payload.pages_processed;
            m_totalFound = payload.total_found;
            m_stoppedAtLimit = payload.stopped_at_limit;
            m_status = ListingStatus::Completed;
            m_statusText = "Found " + std::to_string(payload.total_found) + " objects";
            if (canLoadMore()) {
                m_statusText += " (more available)";
            }
            break;
        }
        case EventType::ProgressMessage: {
            auto& payload = std::get<ProgressMessagePayload>(event.payload);
            LOG_F(1, "Event: Progress %s", payload.text.c_str());
            if (m_status == ListingStatus::Listing || m_status == ListingStatus::Retrying) {
                m_statusText = payload.text;
            }
            break;
        }
    }
}
