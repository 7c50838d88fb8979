// s3scan - progressive S3 bucket listing

#include "listing_model.h"
#include "listing_backend.h"
#include "virtual_folders.h"
#include "settings.h"
#include "aws/s3_gateway.h"
#include "loguru.hpp"

#include <curl/curl.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <thread>
#include <vector>

static std::atomic<bool> g_interrupted{false};

static void sigint_handler(int /*sig*/)
{
    g_interrupted = true;
}

static void print_usage(const char* argv0)
{
    fprintf(stderr,
        "Usage: %s [s3://bucket[/prefix]] [options]\n"
        "  --endpoint-url URL   S3-compatible endpoint (path-style)\n"
        "  --region REGION      Signing region (default us-east-1)\n"
        "  --bucket NAME        Bucket to list\n"
        "  --prefix PREFIX      Only list keys below PREFIX\n"
        "  --max-pages N        Pages per run (default 10)\n"
        "  --max-retries N      Attempts per run (default 3)\n"
        "  --page-size N        Records per display page (default 1000)\n"
        "  --page K             Display page to print (default 1)\n"
        "  --filter TEXT        Case-insensitive key filter\n"
        "  --folders            Group the printed page into virtual folders\n"
        "  --load-more N        Extend the listing up to N times while more is offered\n"
        "  -v, --verbose        Log to stderr\n"
        "Credentials are read from AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY and AWS_SESSION_TOKEN.\n",
        argv0);
}

static bool parse_int(const char* text, int& out)
{
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (!end || *end != '\0' || value <= 0 || value > 1000000) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

static std::string env_or_empty(const char* name)
{
    const char* value = std::getenv(name);
    return value ? value : "";
}

static void print_page(const ListingModel& model, bool folders)
{
    const PageView& view = model.view();
    ObjectRecords page = view.currentPageRecords();

    if (folders) {
        for (const auto& entry : groupIntoFolders(page)) {
            if (entry.is_folder) {
                printf("%-60s  %10s  (%zu files)\n", (entry.name + "/").c_str(),
                       formatSize(entry.total_size).c_str(), entry.file_count);
            } else {
                printf("%-60s  %10s  %s\n", entry.name.c_str(),
                       formatSize(entry.total_size).c_str(),
                       entry.record ? entry.record->last_modified.c_str() : "");
            }
        }
    } else {
        for (const auto& record : page) {
            printf("%-60s  %10s  %-24s  %s\n", record.key.c_str(),
                   formatSize(record.size).c_str(),
                   record.last_modified.c_str(), record.storage_class.c_str());
        }
    }

    size_t start = view.pageStartIndex();
    printf("-- page %d of %d, %zu-%zu of %zu%s objects --\n",
           view.currentPage(), view.totalPages(),
           page.empty() ? 0 : start + 1, start + page.size(), view.filteredCount(),
           view.hasFilter() ? " matching" : "");
}

int main(int argc, char* argv[])
{
    bool verbose = false;
    bool folders = false;
    int loadMoreSteps = 0;
    int displayPage = 1;
    std::string initialPath;
    std::string filter;

    AppSettings settings;
    std::string endpointUrl, region, bucket, prefix;
    int maxPages = 0, maxRetries = 0, pageSize = 0;

    // Filter our flags before passing the rest to loguru
    std::vector<char*> filtered_argv;
    filtered_argv.push_back(argv[0]);
    for (int i = 1; i < argc; ++i) {
        bool hasValue = i + 1 < argc;
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "--folders") == 0) {
            folders = true;
        } else if (strcmp(argv[i], "--endpoint-url") == 0 && hasValue) {
            endpointUrl = argv[++i];
        } else if (strcmp(argv[i], "--region") == 0 && hasValue) {
            region = argv[++i];
        } else if (strcmp(argv[i], "--bucket") == 0 && hasValue) {
            bucket = argv[++i];
        } else if (strcmp(argv[i], "--prefix") == 0 && hasValue) {
            prefix = argv[++i];
        } else if (strcmp(argv[i], "--filter") == 0 && hasValue) {
            filter = argv[++i];
        } else if ((strcmp(argv[i], "--max-pages") == 0 || strcmp(argv[i], "--max-retries") == 0 ||
                    strcmp(argv[i], "--page-size") == 0 || strcmp(argv[i], "--page") == 0 ||
                    strcmp(argv[i], "--load-more") == 0) && hasValue) {
            const char* flag = argv[i];
            int value = 0;
            if (!parse_int(argv[++i], value)) {
                fprintf(stderr, "Invalid value for %s: %s\n", flag, argv[i]);
                return 2;
            }
            if (strcmp(flag, "--max-pages") == 0) maxPages = value;
            else if (strcmp(flag, "--max-retries") == 0) maxRetries = value;
            else if (strcmp(flag, "--page-size") == 0) pageSize = value;
            else if (strcmp(flag, "--page") == 0) displayPage = value;
            else loadMoreSteps = value;
        } else if (strncmp(argv[i], "s3://", 5) == 0 || strncmp(argv[i], "s3:", 3) == 0) {
            initialPath = argv[i];
        } else {
            filtered_argv.push_back(argv[i]);
        }
    }
    filtered_argv.push_back(nullptr);  // argv must be null-terminated
    int filtered_argc = static_cast<int>(filtered_argv.size()) - 1;

    // Initialize logging - stderr off by default, file always on
    loguru::g_stderr_verbosity = verbose ? loguru::Verbosity_INFO : loguru::Verbosity_OFF;
    loguru::init(filtered_argc, filtered_argv.data());
    loguru::add_file("s3scan.log", loguru::Append, loguru::Verbosity_MAX);
    LOG_F(INFO, "s3scan starting (verbose=%s)", verbose ? "true" : "false");

    settings = loadSettings();

    // s3://bucket/prefix
    if (!initialPath.empty()) {
        std::string p = initialPath.substr(initialPath.find(':') + 1);
        while (!p.empty() && p[0] == '/') p = p.substr(1);
        size_t slash = p.find('/');
        bucket = p.substr(0, slash);
        if (slash != std::string::npos) prefix = p.substr(slash + 1);
    }

    // Command line > environment > settings file
    ConnectionConfig config;
    config.endpoint_url = !endpointUrl.empty() ? endpointUrl : settings.endpoint_url;
    if (!region.empty()) config.region = region;
    else if (!env_or_empty("AWS_REGION").empty()) config.region = env_or_empty("AWS_REGION");
    else config.region = settings.region;
    config.bucket = !bucket.empty() ? bucket : settings.bucket;
    config.prefix = prefix;
    config.access_key_id = env_or_empty("AWS_ACCESS_KEY_ID");
    config.secret_access_key = env_or_empty("AWS_SECRET_ACCESS_KEY");
    config.session_token = env_or_empty("AWS_SESSION_TOKEN");

    if (config.bucket.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    maxPages = maxPages > 0 ? maxPages : settings.max_pages;
    maxRetries = maxRetries > 0 ? maxRetries : settings.max_retries;
    pageSize = pageSize > 0 ? pageSize : settings.page_size;

    ListingOptions options;
    options.retry_backoff = std::chrono::milliseconds(settings.retry_backoff_ms);

    curl_global_init(CURL_GLOBAL_DEFAULT);
    std::signal(SIGINT, sigint_handler);

    int exitCode = 0;
    {
        ListingModel model;
        model.setBackend(std::make_unique<ListingBackend>(makeS3Gateway, options));
        model.view().setPageSize(pageSize);
        model.view().setFilter(filter);
        model.connect(config, maxPages, maxRetries);

        std::string lastStatus;
        while (true) {
            if (g_interrupted.exchange(false)) {
                LOG_F(INFO, "Interrupted by user");
                model.cancel();
            }

            model.processEvents();

            if (model.statusText() != lastStatus) {
                lastStatus = model.statusText();
                fprintf(stderr, "%s\n", lastStatus.c_str());
            }

            if (model.status() == ListingStatus::Completed && loadMoreSteps > 0 && model.canLoadMore()) {
                --loadMoreSteps;
                model.loadMore();
                continue;
            }

            if (!model.isBusy()) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(16));
        }

        if (model.status() == ListingStatus::Failed) {
            exitCode = 1;
        } else {
            model.view().goToPage(displayPage);
            print_page(model, folders);
        }

        // Remember where we were
        settings.endpoint_url = config.endpoint_url;
        settings.region = config.region;
        settings.bucket = config.bucket;
        settings.page_size = pageSize;
        saveSettings(settings);
    }

    curl_global_cleanup();
    LOG_F(INFO, "s3scan exiting with %d", exitCode);
    return exitCode;
}
