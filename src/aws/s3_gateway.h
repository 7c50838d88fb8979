#pragma once

#include "object_gateway.h"
#include "aws_signer.h"
#include <string>
#include <map>
#include <atomic>

// ListObjectsV2 over HTTP(S), signed with SigV4.
class S3Gateway : public IObjectGateway {
public:
    explicit S3Gateway(const ConnectionConfig& config);
    ~S3Gateway() override;

    PageResult fetchPage(
        const std::string& continuation_token,
        const std::atomic<bool>* cancel_flag = nullptr
    ) override;

    // Signed request for one page (exposed for tests)
    AWSSignedRequest buildListRequest(const std::string& continuation_token,
                                      const std::string& timestamp = "") const;

    // Parse a ListObjectsV2 response body. An <Error> document yields a
    // failed result classified with classifyServiceError.
    static PageResult parseListObjectsXml(const std::string& xml, const std::string& bucket);

    // Map an S3 error code / HTTP status to the store error taxonomy
    static StoreError classifyServiceError(const std::string& code,
                                           const std::string& message,
                                           long http_status,
                                           const std::string& bucket);

    static StoreError connectivityError(const std::string& detail);

    // Split an endpoint URL into scheme and host[:port]
    static void parseEndpoint(const std::string& endpoint_url, std::string& scheme, std::string& host);

private:
    struct HttpResponse {
        std::string body;
        long status = 0;
        bool cancelled = false;
        std::string transport_error;    // empty on success
    };

    HttpResponse httpGet(const std::string& url,
                         const std::map<std::string, std::string>& headers,
                         const std::atomic<bool>* cancel_flag) const;

    ConnectionConfig m_config;
    std::string m_scheme;
    std::string m_host;
    std::string m_path;
};

// GatewayFactory for real S3 endpoints
std::unique_ptr<IObjectGateway> makeS3Gateway(const ConnectionConfig& config, StoreError& out_error);
