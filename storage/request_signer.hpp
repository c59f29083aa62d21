#pragma once
#include <ctime>
#include <map>
#include <string>

// What AWS Signature Version 4 needs to know about one HTTP request.
struct SigningInput {
    std::string method;
    std::string canonicalUri;                       // path, already URI-encoded
    std::map<std::string, std::string> query;       // raw names and values
    std::map<std::string, std::string> headers;     // lower-case names; every one is signed
    std::string payloadHash;                        // hex SHA-256 or "UNSIGNED-PAYLOAD"
};

class RequestSigner {
public:
    RequestSigner(std::string accessKey, std::string secretKey, std::string region,
                  std::string service = "s3");

    // value for the Authorization header; amzDate is the request's x-amz-date
    std::string authorization(const SigningInput& input, const std::string& amzDate) const;

    std::string canonicalRequest(const SigningInput& input) const;
    std::string stringToSign(const std::string& canonicalRequest, const std::string& amzDate) const;

    static std::string canonicalQuery(const std::map<std::string, std::string>& query);
    static std::string amzDate(std::time_t when);

    static const char* EMPTY_PAYLOAD_HASH;

private:
    std::string scope(const std::string& amzDate) const;
    std::string signedHeaders(const SigningInput& input) const;

    std::string accessKey_;
    std::string secretKey_;
    std::string region_;
    std::string service_;
};
