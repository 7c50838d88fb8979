#include "s3_gateway.h"
#include "loguru.hpp"
#include <curl/curl.h>
#include <sstream>
#include <chrono>
#include <cctype>
#include <cstdlib>

static size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total = size * nmemb;
    userp->append(static_cast<char*>(contents), total);
    return total;
}

// Progress callback for cancellable requests
// Longest time a request goes without looking at its cancel flag
static constexpr int kCancelPollMs = 50;

static int cancelCheckProgressCallback(void* clientp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                                       curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* cancel_flag = static_cast<const std::atomic<bool>*>(clientp);
    if (cancel_flag && cancel_flag->load()) {
        return 1;  // Non-zero aborts the transfer
    }
    return 0;
}

static std::string extractTag(const std::string& xml, const std::string& tag) {
    std::string open = "<" + tag + ">";
    std::string close = "</" + tag + ">";
    size_t start = xml.find(open);
    if (start == std::string::npos) return "";
    start += open.size();
    size_t end = xml.find(close, start);
    if (end == std::string::npos) return "";
    return xml.substr(start, end - start);
}

static std::string decodeXmlEntities(const std::string& text) {
    if (text.find('&') == std::string::npos) return text;

    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '&') {
            out += text[i++];
            continue;
        }
        size_t semi = text.find(';', i);
        if (semi == std::string::npos) {
            out += text.substr(i);
            break;
        }
        std::string entity = text.substr(i + 1, semi - i - 1);
        if (entity == "amp") out += '&';
        else if (entity == "lt") out += '<';
        else if (entity == "gt") out += '>';
        else if (entity == "quot") out += '"';
        else if (entity == "apos") out += '\'';
        else if (entity.size() > 1 && entity[0] == '#') {
            bool hex = entity[1] == 'x' || entity[1] == 'X';
            const char* digits = entity.c_str() + (hex ? 2 : 1);
            char* end = nullptr;
            long code = *digits ? std::strtol(digits, &end, hex ? 16 : 10) : 0;
            bool valid = end && *end == '\0' && std::isxdigit(static_cast<unsigned char>(*digits)) &&
                         code >= 1 && code <= 0x10FFFF && !(code >= 0xD800 && code <= 0xDFFF);
            if (!valid) {
                // Not a Unicode scalar we can encode, keep the reference as text
                out += text.substr(i, semi - i + 1);
            } else if (code < 0x80) {
                out += static_cast<char>(code);
            } else if (code < 0x800) {
                out += static_cast<char>(0xC0 | (code >> 6));
                out += static_cast<char>(0x80 | (code & 0x3F));
            } else if (code < 0x10000) {
                out += static_cast<char>(0xE0 | (code >> 12));
                out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (code & 0x3F));
            } else {
                out += static_cast<char>(0xF0 | (code >> 18));
                out += static_cast<char>(0x80 | ((code >> 12) & 0x3F));
                out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (code & 0x3F));
            }
        } else {
            out += text.substr(i, semi - i + 1);  // unknown entity, keep verbatim
        }
        i = semi + 1;
    }
    return out;
}

static std::string stripQuotes(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    if (end > start && s[start] == '"') ++start;
    if (end > start && s[end - 1] == '"') --end;
    return s.substr(start, end - start);
}

const char* storeErrorKindName(StoreErrorKind kind) {
    switch (kind) {
        case StoreErrorKind::None: return "None";
        case StoreErrorKind::Connectivity: return "Connectivity";
        case StoreErrorKind::Auth: return "Auth";
        case StoreErrorKind::NotFound: return "NotFound";
        case StoreErrorKind::Permission: return "Permission";
        case StoreErrorKind::Unknown: return "Unknown";
    }
    return "Unknown";
}

S3Gateway::S3Gateway(const ConnectionConfig& config)
    : m_config(config)
{
    if (!m_config.endpoint_url.empty()) {
        // Path-style: endpoint/bucket
        parseEndpoint(m_config.endpoint_url, m_scheme, m_host);
        m_path = "/" + m_config.bucket;
    } else {
        // Virtual-host style: bucket.s3.region.amazonaws.com
        m_scheme = "https";
        m_host = m_config.bucket + ".s3." + m_config.region + ".amazonaws.com";
        m_path = "/";
    }
    LOG_F(1, "S3Gateway: bucket=%s host=%s path=%s scheme=%s",
          m_config.bucket.c_str(), m_host.c_str(), m_path.c_str(), m_scheme.c_str());
}

S3Gateway::~S3Gateway() = default;

void S3Gateway::parseEndpoint(const std::string& endpoint_url, std::string& scheme, std::string& host) {
    std::string url = endpoint_url;
    scheme = "https";

    if (url.find("https://") == 0) {
        url = url.substr(8);
    } else if (url.find("http://") == 0) {
        scheme = "http";
        url = url.substr(7);
    }

    // Keep only host:port
    size_t pathPos = url.find('/');
    if (pathPos != std::string::npos) {
        url = url.substr(0, pathPos);
    }
    host = url;
}

AWSSignedRequest S3Gateway::buildListRequest(const std::string& continuation_token,
                                             const std::string& timestamp) const {
    std::ostringstream query;
    query << "list-type=2";
    query << "&max-keys=" << m_config.page_capacity;
    if (!m_config.prefix.empty()) {
        query << "&prefix=" << aws_uri_encode(m_config.prefix);
    }
    if (!continuation_token.empty()) {
        query << "&continuation-token=" << aws_uri_encode(continuation_token);
    }

    AWSSigningParams params;
    params.method = "GET";
    params.scheme = m_scheme;
    params.host = m_host;
    params.path = m_path;
    params.query = query.str();
    params.region = m_config.region;
    params.service = "s3";
    params.access_key = m_config.access_key_id;
    params.secret_key = m_config.secret_access_key;
    params.session_token = m_config.session_token;
    params.timestamp = timestamp;
    return aws_sign_request(params);
}

PageResult S3Gateway::fetchPage(const std::string& continuation_token,
                                const std::atomic<bool>* cancel_flag) {
    LOG_F(1, "S3Gateway: listing bucket=%s token=%s",
          m_config.bucket.c_str(),
          continuation_token.empty() ? "(none)" : continuation_token.substr(0, 20).c_str());

    auto signedReq = buildListRequest(continuation_token);

    auto http_start = std::chrono::steady_clock::now();
    HttpResponse response = httpGet(signedReq.url, signedReq.headers, cancel_flag);
    auto http_end = std::chrono::steady_clock::now();
    auto http_ms = std::chrono::duration_cast<std::chrono::milliseconds>(http_end - http_start).count();

    if (response.cancelled) {
        LOG_F(INFO, "S3Gateway: list cancelled bucket=%s (http=%ldms)",
              m_config.bucket.c_str(), static_cast<long>(http_ms));
        PageResult result;
        result.cancelled = true;
        return result;
    }

    if (!response.transport_error.empty()) {
        LOG_F(WARNING, "S3Gateway: list HTTP error: %s (http=%ldms)",
              response.transport_error.c_str(), static_cast<long>(http_ms));
        PageResult result;
        result.error = connectivityError(response.transport_error);
        return result;
    }

    auto parse_start = std::chrono::steady_clock::now();
    PageResult result = parseListObjectsXml(response.body, m_config.bucket);
    auto parse_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - parse_start).count();

    if (!result.error && response.status >= 400) {
        // Error status without an S3 error document
        result = PageResult();
        result.error = classifyServiceError("", "HTTP " + std::to_string(response.status),
                                            response.status, m_config.bucket);
    }

    if (result.error) {
        LOG_F(WARNING, "S3Gateway: list S3 error kind=%s status=%ld: %s (http=%ldms)",
              storeErrorKindName(result.error.kind), response.status,
              result.error.message.c_str(), static_cast<long>(http_ms));
    } else {
        LOG_F(INFO, "S3Gateway: list success bucket=%s count=%zu truncated=%d (http=%ldms parse=%ldms)",
              m_config.bucket.c_str(), result.records.size(), result.has_more,
              static_cast<long>(http_ms), static_cast<long>(parse_ms));
    }
    return result;
}

S3Gateway::HttpResponse S3Gateway::httpGet(const std::string& url,
                                           const std::map<std::string, std::string>& headers,
                                           const std::atomic<bool>* cancel_flag) const {
    HttpResponse response;

    CURL* curl = curl_easy_init();
    CURLM* multi = curl_multi_init();
    if (!curl || !multi) {
        if (curl) curl_easy_cleanup(curl);
        if (multi) curl_multi_cleanup(multi);
        response.transport_error = "Failed to init curl";
        return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 30L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (cancel_flag) {
        // Aborts a transfer that is moving data; the poll loop below covers
        // stalled connects and silent servers
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, cancelCheckProgressCallback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<std::atomic<bool>*>(cancel_flag));
    }

    struct curl_slist* headerList = nullptr;
    for (const auto& [key, value] : headers) {
        std::string header = key + ": " + value;
        headerList = curl_slist_append(headerList, header.c_str());
    }
    if (headerList) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);
    }

    curl_multi_add_handle(multi, curl);

    CURLcode res = CURLE_OK;
    bool done = false;
    while (!done) {
        if (cancel_flag && cancel_flag->load()) {
            res = CURLE_ABORTED_BY_CALLBACK;
            break;
        }

        int running = 0;
        CURLMcode mc = curl_multi_perform(multi, &running);
        if (mc != CURLM_OK) {
            response.transport_error = curl_multi_strerror(mc);
            break;
        }

        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi, &queued)) {
            if (msg->msg == CURLMSG_DONE && msg->easy_handle == curl) {
                res = msg->data.result;
                done = true;
            }
        }
        if (done) break;

        // Wake at least every kCancelPollMs to look at the cancel flag
        mc = curl_multi_poll(multi, nullptr, 0, kCancelPollMs, nullptr);
        if (mc != CURLM_OK) {
            response.transport_error = curl_multi_strerror(mc);
            break;
        }
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

    curl_multi_remove_handle(multi, curl);
    if (headerList) curl_slist_free_all(headerList);
    curl_easy_cleanup(curl);
    curl_multi_cleanup(multi);

    if (!response.transport_error.empty()) {
        return response;
    }
    if (res == CURLE_ABORTED_BY_CALLBACK) {
        response.cancelled = true;
    } else if (res != CURLE_OK) {
        response.transport_error = curl_easy_strerror(res);
    }
    return response;
}

StoreError S3Gateway::connectivityError(const std::string& detail) {
    StoreError error;
    error.kind = StoreErrorKind::Connectivity;
    error.message = "Cannot connect to the endpoint. Please check the URL.";
    if (!detail.empty()) {
        error.message += " (" + detail + ")";
    }
    return error;
}

StoreError S3Gateway::classifyServiceError(const std::string& code,
                                           const std::string& message,
                                           long http_status,
                                           const std::string& bucket) {
    StoreError error;
    if (code == "InvalidAccessKeyId" || code == "SignatureDoesNotMatch" ||
        code == "ExpiredToken" || code == "InvalidToken" || code == "TokenRefreshRequired") {
        error.kind = StoreErrorKind::Auth;
        error.message = "Invalid credentials. Please check your access key and secret key.";
    } else if (code == "NoSuchBucket" || (code.empty() && http_status == 404)) {
        error.kind = StoreErrorKind::NotFound;
        error.message = "Bucket '" + bucket + "' does not exist.";
    } else if (code == "AccessDenied" || code == "AllAccessDisabled" ||
               (code.empty() && http_status == 403)) {
        error.kind = StoreErrorKind::Permission;
        error.message = "Access denied. Please check your credentials and permissions.";
    } else {
        error.kind = StoreErrorKind::Unknown;
        error.message = "AWS Error: " + (message.empty() ? code : message);
    }
    return error;
}

PageResult S3Gateway::parseListObjectsXml(const std::string& xml, const std::string& bucket) {
    PageResult result;

    if (xml.find("<Error>") != std::string::npos) {
        std::string code = extractTag(xml, "Code");
        std::string message = decodeXmlEntities(extractTag(xml, "Message"));
        result.error = classifyServiceError(code, message, 0, bucket);
        return result;
    }

    result.has_more = (extractTag(xml, "IsTruncated") == "true");
    result.next_continuation_token = decodeXmlEntities(extractTag(xml, "NextContinuationToken"));

    std::string contentsSearch = "<Contents>";
    std::string contentsEnd = "</Contents>";
    size_t pos = 0;
    while (true) {
        size_t start = xml.find(contentsSearch, pos);
        if (start == std::string::npos) break;
        size_t end = xml.find(contentsEnd, start);
        if (end == std::string::npos) break;

        std::string contentsXml = xml.substr(start, end - start);

        ObjectRecord record;
        record.key = decodeXmlEntities(extractTag(contentsXml, "Key"));

        std::string sizeStr = extractTag(contentsXml, "Size");
        record.size = sizeStr.empty() ? 0 : std::strtoll(sizeStr.c_str(), nullptr, 10);
        if (record.size < 0) record.size = 0;

        record.last_modified = extractTag(contentsXml, "LastModified");
        record.etag = stripQuotes(decodeXmlEntities(extractTag(contentsXml, "ETag")));

        std::string storageClass = extractTag(contentsXml, "StorageClass");
        if (!storageClass.empty()) {
            record.storage_class = storageClass;
        }

        if (!record.key.empty()) {
            result.records.push_back(std::move(record));
        }

        pos = end + contentsEnd.size();
    }

    // A truncated page without a token cannot be continued
    if (result.has_more && result.next_continuation_token.empty()) {
        LOG_F(WARNING, "S3Gateway: truncated response without NextContinuationToken, treating as last page");
        result.has_more = false;
    }

    return result;
}

std::unique_ptr<IObjectGateway> makeS3Gateway(const ConnectionConfig& config, StoreError& out_error) {
    if (config.access_key_id.empty() || config.secret_access_key.empty()) {
        out_error.kind = StoreErrorKind::Auth;
        out_error.message = "Invalid credentials. Please check your access key and secret key.";
        return nullptr;
    }
    if (config.bucket.empty()) {
        out_error.kind = StoreErrorKind::NotFound;
        out_error.message = "Bucket '' does not exist.";
        return nullptr;
    }
    return std::make_unique<S3Gateway>(config);
}
