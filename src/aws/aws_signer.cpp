#include "aws_signer.h"
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <cctype>
#include <ctime>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <vector>

static std::string to_hex(const unsigned char* data, size_t len) {
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        ss << std::setw(2) << static_cast<int>(data[i]);
    }
    return ss.str();
}

static std::string sha256_hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

static std::string hmac_sha256(const std::string& key, const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    unsigned int len = SHA256_DIGEST_LENGTH;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         hash, &len);
    return std::string(reinterpret_cast<char*>(hash), len);
}

static std::string current_timestamp() {
    time_t now = time(nullptr);
    struct tm tm_buf;
    gmtime_r(&now, &tm_buf);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm_buf);
    return buf;
}

std::string aws_uri_encode(const std::string& value, bool encode_slash) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;

    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == '/' && !encode_slash) {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << static_cast<int>(c);
        }
    }

    return escaped.str();
}

std::string aws_canonical_query(const std::string& query) {
    if (query.empty()) return "";

    std::vector<std::pair<std::string, std::string>> params;
    std::istringstream iss(query);
    std::string param;
    while (std::getline(iss, param, '&')) {
        if (param.empty()) continue;
        size_t eq = param.find('=');
        if (eq != std::string::npos) {
            params.emplace_back(param.substr(0, eq), param.substr(eq + 1));
        } else {
            params.emplace_back(param, "");
        }
    }

    std::sort(params.begin(), params.end());

    // Every parameter keeps its '=' even when the value is empty
    std::ostringstream result;
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0) result << "&";
        result << params[i].first << "=" << params[i].second;
    }
    return result.str();
}

AWSSignedRequest aws_sign_request(const AWSSigningParams& params) {
    std::string timestamp = params.timestamp.empty() ? current_timestamp() : params.timestamp;
    std::string date = timestamp.substr(0, 8);

    std::string payload_hash = sha256_hex(params.payload);
    std::string canonical_uri = params.path.empty() ? "/" : aws_uri_encode(params.path, false);
    std::string canonical_query = aws_canonical_query(params.query);
    bool has_token = !params.session_token.empty();

    // Canonical headers (sorted, lowercase)
    std::ostringstream canonical_headers;
    canonical_headers << "host:" << params.host << "\n";
    canonical_headers << "x-amz-content-sha256:" << payload_hash << "\n";
    canonical_headers << "x-amz-date:" << timestamp << "\n";
    if (has_token) {
        canonical_headers << "x-amz-security-token:" << params.session_token << "\n";
    }

    std::string signed_headers = "host;x-amz-content-sha256;x-amz-date";
    if (has_token) {
        signed_headers += ";x-amz-security-token";
    }

    std::ostringstream canonical_request;
    canonical_request << params.method << "\n"
                      << canonical_uri << "\n"
                      << canonical_query << "\n"
                      << canonical_headers.str() << "\n"
                      << signed_headers << "\n"
                      << payload_hash;

    const std::string algorithm = "AWS4-HMAC-SHA256";
    std::string credential_scope = date + "/" + params.region + "/" + params.service + "/aws4_request";

    std::ostringstream string_to_sign;
    string_to_sign << algorithm << "\n"
                   << timestamp << "\n"
                   << credential_scope << "\n"
                   << sha256_hex(canonical_request.str());

    // Signing key
    std::string k_date = hmac_sha256("AWS4" + params.secret_key, date);
    std::string k_region = hmac_sha256(k_date, params.region);
    std::string k_service = hmac_sha256(k_region, params.service);
    std::string k_signing = hmac_sha256(k_service, "aws4_request");

    std::string raw_signature = hmac_sha256(k_signing, string_to_sign.str());
    std::string signature = to_hex(reinterpret_cast<const unsigned char*>(raw_signature.data()),
                                   raw_signature.size());

    std::ostringstream auth;
    auth << algorithm << " "
         << "Credential=" << params.access_key << "/" << credential_scope << ", "
         << "SignedHeaders=" << signed_headers << ", "
         << "Signature=" << signature;

    AWSSignedRequest result;
    result.url = params.scheme + "://" + params.host + canonical_uri;
    if (!canonical_query.empty()) {
        result.url += "?" + canonical_query;
    }

    result.headers["Host"] = params.host;
    result.headers["x-amz-date"] = timestamp;
    result.headers["x-amz-content-sha256"] = payload_hash;
    result.headers["Authorization"] = auth.str();
    if (has_token) {
        result.headers["x-amz-security-token"] = params.session_token;
    }

    return result;
}
