#pragma once

#include <string>
#include <map>

struct AWSSignedRequest {
    std::string url;
    std::map<std::string, std::string> headers;
};

struct AWSSigningParams {
    std::string method = "GET";
    std::string scheme = "https";   // http for plain-text S3-compatible endpoints
    std::string host;               // host[:port]
    std::string path = "/";
    std::string query;              // already URI-encoded, any order
    std::string region;
    std::string service = "s3";
    std::string access_key;
    std::string secret_key;
    std::string session_token;
    std::string payload;
    std::string timestamp;          // YYYYMMDDTHHMMSSZ, empty = now
};

// Sign an AWS request using Signature Version 4
AWSSignedRequest aws_sign_request(const AWSSigningParams& params);

// Sort a query string by parameter name (and value), as SigV4 requires
std::string aws_canonical_query(const std::string& query);

// RFC 3986 percent-encoding. Slashes survive when encode_slash is false.
std::string aws_uri_encode(const std::string& value, bool encode_slash = true);
